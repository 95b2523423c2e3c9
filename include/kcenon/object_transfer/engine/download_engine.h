/**
 * @file download_engine.h
 * @brief Resumable streamed download orchestration
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_DOWNLOAD_ENGINE_H
#define KCENON_OBJECT_TRANSFER_ENGINE_DOWNLOAD_ENGINE_H

#include <kcenon/object_transfer/engine/transfer_engine.h>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace kcenon::object_transfer {

/**
 * @brief Per-download options
 */
struct download_options {
    /// Continue from an existing partial file at the destination
    bool resumable = true;

    /// Replace a destination file that is not a partial of this object
    bool overwrite = false;

    /// Download to "name (N).ext" instead of failing on a conflict
    bool unique_name_on_conflict = false;

    /// Compare the file digest with the checksum the store reports
    bool verify_checksum = true;
};

/**
 * @brief Download engine
 *
 * Every run starts with a pre-flight: the object is headed, an existing
 * destination file is adopted as a resume offset or resolved per the
 * options, and free disk space is checked. The object is then streamed
 * from the resume offset and appended to the destination. A retryable
 * failure mid-stream reopens the range at the last byte written.
 *
 * Pausing keeps the partial file. Cancelling deletes it only when the
 * task had made no progress before the cancelled run.
 */
class download_engine : public transfer_engine {
public:
    download_engine(engine_resources resources,
                    transfer_config config,
                    transfer_callbacks callbacks = {});
    ~download_engine() override;

    /**
     * @brief Start downloading @p task.object_key to @p task.local_path
     */
    [[nodiscard]] auto start(transfer_task task, const download_options& options = {})
        -> result<transfer_id>;

    /**
     * @brief First free "stem (N)ext" next to @p desired, N in [1, 1000]
     */
    [[nodiscard]] static auto unique_path(const std::filesystem::path& desired)
        -> result<std::filesystem::path>;

protected:
    auto run(task_context& ctx) -> void override;
    auto cancel_idle(task_context& ctx) -> void override;
    [[nodiscard]] auto make_retry_context(task_context& failed, transfer_task task)
        -> std::shared_ptr<task_context> override;

private:
    struct download_context;

    [[nodiscard]] auto preflight(download_context& ctx, const retry_policy& policy)
        -> result<void>;
    [[nodiscard]] auto stream_object(download_context& ctx,
                                     const retry_policy& policy,
                                     std::size_t buffer_size) -> result<void>;
    [[nodiscard]] auto verify_content(download_context& ctx) -> result<void>;

    /**
     * @brief Delete the destination when this engine wrote it and
     *        @p prior_bytes (progress before the stopped run) is zero
     */
    auto discard_unstarted(download_context& ctx, uint64_t prior_bytes) -> void;
    auto stop_run(download_context& ctx) -> void;

    auto validate_destination(transfer_task& task) const -> result<void>;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_DOWNLOAD_ENGINE_H

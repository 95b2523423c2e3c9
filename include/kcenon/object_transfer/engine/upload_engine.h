/**
 * @file upload_engine.h
 * @brief Single-put and multipart upload orchestration
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_UPLOAD_ENGINE_H
#define KCENON_OBJECT_TRANSFER_ENGINE_UPLOAD_ENGINE_H

#include <kcenon/object_transfer/core/part_planner.h>
#include <kcenon/object_transfer/engine/transfer_engine.h>

#include <memory>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Per-upload options
 */
struct upload_options {
    /// Use multipart even when the file is at or below the threshold
    bool force_multipart = false;
};

/**
 * @brief Upload engine
 *
 * Files larger than the multipart threshold are uploaded as parts, each
 * part admitted by the shared concurrency_limiter and wrapped in
 * with_retry(). A part that exhausts its retries aborts the multipart
 * upload and fails the task. Resuming lists the parts the store already
 * holds and uploads only the missing ones.
 *
 * @code
 * upload_engine engine(resources, config, callbacks);
 * auto id = engine.start(transfer_task::make_upload("backups/db.tar", path));
 * auto done = engine.wait(id.value());
 * @endcode
 */
class upload_engine : public transfer_engine {
public:
    upload_engine(engine_resources resources,
                  transfer_config config,
                  transfer_callbacks callbacks = {});
    ~upload_engine() override;

    /**
     * @brief Start uploading @p task.local_path to @p task.object_key
     *
     * @p task must be a pending upload task whose source is a regular file.
     */
    [[nodiscard]] auto start(transfer_task task, const upload_options& options = {})
        -> result<transfer_id>;

    /**
     * @brief Continue a multipart upload begun elsewhere (e.g. an earlier process)
     *
     * Parts already listed by the store under @p upload_id are not sent again.
     */
    [[nodiscard]] auto resume_upload(transfer_task task,
                                     std::string upload_id,
                                     const upload_options& options = {})
        -> result<transfer_id>;

    /**
     * @brief Part plan of a multipart task as of its latest run
     */
    [[nodiscard]] auto get_parts(const transfer_id& id) const
        -> result<std::vector<part_descriptor>>;

protected:
    auto run(task_context& ctx) -> void override;
    auto cancel_idle(task_context& ctx) -> void override;
    [[nodiscard]] auto make_retry_context(task_context& failed, transfer_task task)
        -> std::shared_ptr<task_context> override;

private:
    struct upload_context;

    auto run_single_put(upload_context& ctx, const retry_policy& policy) -> void;
    auto run_multipart(upload_context& ctx, const retry_policy& policy) -> void;
    auto abort_upload(upload_context& ctx, const std::string& upload_id) -> void;
    auto validate_source(transfer_task& task) const -> result<void>;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_UPLOAD_ENGINE_H

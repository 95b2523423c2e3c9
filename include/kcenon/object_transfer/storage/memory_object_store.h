/**
 * @file memory_object_store.h
 * @brief In-process object store with S3-like semantics
 */

#ifndef KCENON_OBJECT_TRANSFER_STORAGE_MEMORY_OBJECT_STORE_H
#define KCENON_OBJECT_TRANSFER_STORAGE_MEMORY_OBJECT_STORE_H

#include <kcenon/object_transfer/storage/object_store.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Thread-safe object store kept entirely in memory
 *
 * Mirrors the observable behaviour of S3 that the engines rely on:
 * - single-put etag is the MD5 hex of the content
 * - multipart etag is MD5 over the binary part MD5s, suffixed "-<parts>"
 * - parts can be re-uploaded (last write wins) until completion
 * - completion rejects unknown parts, stale etags and unordered lists
 * - every stored object carries a content SHA-256
 *
 * @code
 * auto store = std::make_shared<memory_object_store>();
 * store->seed_object("reports/q1.csv", bytes);
 * auto meta = store->head_object("reports/q1.csv", {});
 * @endcode
 */
class memory_object_store : public object_store {
public:
    memory_object_store();
    ~memory_object_store() override;

    memory_object_store(const memory_object_store&) = delete;
    auto operator=(const memory_object_store&) -> memory_object_store& = delete;

    // object_store
    [[nodiscard]] auto head_object(const std::string& key,
                                   const request_context& ctx)
        -> result<object_metadata> override;
    [[nodiscard]] auto put_object(const std::string& key,
                                  std::span<const std::byte> data,
                                  const request_context& ctx)
        -> result<std::string> override;
    [[nodiscard]] auto create_multipart_upload(const std::string& key,
                                               const request_context& ctx)
        -> result<std::string> override;
    [[nodiscard]] auto upload_part(const std::string& key,
                                   const std::string& upload_id,
                                   uint32_t part_number,
                                   std::span<const std::byte> data,
                                   const request_context& ctx)
        -> result<std::string> override;
    [[nodiscard]] auto list_parts(const std::string& key,
                                  const std::string& upload_id,
                                  const request_context& ctx)
        -> result<std::vector<uploaded_part>> override;
    [[nodiscard]] auto complete_multipart_upload(
        const std::string& key,
        const std::string& upload_id,
        const std::vector<completed_part>& parts,
        const request_context& ctx) -> result<std::string> override;
    [[nodiscard]] auto abort_multipart_upload(const std::string& key,
                                              const std::string& upload_id,
                                              const request_context& ctx)
        -> result<void> override;
    [[nodiscard]] auto get_object_range(const std::string& key,
                                        uint64_t start_byte,
                                        const request_context& ctx)
        -> result<std::unique_ptr<object_read_stream>> override;

    /**
     * @brief Store an object directly, bypassing the upload path
     */
    auto seed_object(const std::string& key, std::vector<std::byte> data) -> void;

    /**
     * @brief Replace an object's content (changes its etag)
     */
    auto replace_object(const std::string& key, std::vector<std::byte> data) -> void;

    [[nodiscard]] auto object_data(const std::string& key) const
        -> std::optional<std::vector<std::byte>>;
    [[nodiscard]] auto contains(const std::string& key) const -> bool;
    [[nodiscard]] auto object_count() const -> std::size_t;

    /**
     * @brief Whether @p upload_id is still open (neither completed nor aborted)
     */
    [[nodiscard]] auto has_upload(const std::string& upload_id) const -> bool;
    [[nodiscard]] auto open_upload_count() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_STORAGE_MEMORY_OBJECT_STORE_H

/**
 * @file object_store.h
 * @brief Object store capability consumed by the transfer engines
 *
 * The engines never talk to a storage service directly. They are given an
 * object_store at construction time, which makes the wire protocol (S3,
 * S3-compatible services, a test double) an implementation detail of
 * whoever provides the store.
 */

#ifndef KCENON_OBJECT_TRANSFER_STORAGE_OBJECT_STORE_H
#define KCENON_OBJECT_TRANSFER_STORAGE_OBJECT_STORE_H

#include <kcenon/object_transfer/core/cancellation_token.h>
#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Per-call parameters passed to every store operation
 *
 * Implementations must give up with error_code::request_timeout once
 * @p timeout elapses, and should abort early when @p token reports a stop.
 */
struct request_context {
    std::chrono::milliseconds timeout{30000};
    const cancellation_token* token = nullptr;
};

/**
 * @brief Result of a head-object request
 */
struct object_metadata {
    std::string key;
    uint64_t size = 0;
    std::string etag;
    std::chrono::system_clock::time_point last_modified;
    std::optional<std::string> content_sha256;  ///< Hex, when the store tracks it
    std::optional<std::string> content_md5;     ///< Hex, when the store tracks it
};

/**
 * @brief A part the store already holds for a multipart upload
 */
struct uploaded_part {
    uint32_t part_number = 0;
    std::string etag;
    uint64_t size = 0;
};

/**
 * @brief Part reference sent with complete-multipart-upload
 */
struct completed_part {
    uint32_t part_number = 0;
    std::string etag;

    [[nodiscard]] auto operator==(const completed_part& other) const -> bool = default;
};

/**
 * @brief Byte stream returned by get_object_range
 *
 * read() returns 0 at end of stream. A failed read leaves the stream
 * unusable; the caller opens a new range from the last byte it kept.
 */
class object_read_stream {
public:
    virtual ~object_read_stream() = default;

    [[nodiscard]] virtual auto read(std::span<std::byte> buffer)
        -> result<std::size_t> = 0;

    /**
     * @brief Absolute object offset of the next byte read() returns
     */
    [[nodiscard]] virtual auto position() const -> uint64_t = 0;
};

/**
 * @brief Object store operations used by the engines
 *
 * Implementations must be safe to call from several threads at once.
 */
class object_store {
public:
    virtual ~object_store() = default;

    [[nodiscard]] virtual auto head_object(const std::string& key,
                                           const request_context& ctx)
        -> result<object_metadata> = 0;

    /**
     * @return etag of the stored object
     */
    [[nodiscard]] virtual auto put_object(const std::string& key,
                                          std::span<const std::byte> data,
                                          const request_context& ctx)
        -> result<std::string> = 0;

    /**
     * @return upload id
     */
    [[nodiscard]] virtual auto create_multipart_upload(const std::string& key,
                                                       const request_context& ctx)
        -> result<std::string> = 0;

    /**
     * @return etag of the part
     */
    [[nodiscard]] virtual auto upload_part(const std::string& key,
                                           const std::string& upload_id,
                                           uint32_t part_number,
                                           std::span<const std::byte> data,
                                           const request_context& ctx)
        -> result<std::string> = 0;

    [[nodiscard]] virtual auto list_parts(const std::string& key,
                                          const std::string& upload_id,
                                          const request_context& ctx)
        -> result<std::vector<uploaded_part>> = 0;

    /**
     * @param parts Strictly ascending by part_number
     * @return etag of the assembled object
     */
    [[nodiscard]] virtual auto complete_multipart_upload(
        const std::string& key,
        const std::string& upload_id,
        const std::vector<completed_part>& parts,
        const request_context& ctx) -> result<std::string> = 0;

    [[nodiscard]] virtual auto abort_multipart_upload(const std::string& key,
                                                      const std::string& upload_id,
                                                      const request_context& ctx)
        -> result<void> = 0;

    /**
     * @brief Open a stream over [start_byte, end of object)
     */
    [[nodiscard]] virtual auto get_object_range(const std::string& key,
                                                uint64_t start_byte,
                                                const request_context& ctx)
        -> result<std::unique_ptr<object_read_stream>> = 0;

protected:
    object_store() = default;
    object_store(const object_store&) = default;
    auto operator=(const object_store&) -> object_store& = default;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_STORAGE_OBJECT_STORE_H

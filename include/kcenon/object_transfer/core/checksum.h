/**
 * @file checksum.h
 * @brief Content digests for integrity verification (OpenSSL EVP)
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_CHECKSUM_H
#define KCENON_OBJECT_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/object_transfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::object_transfer {

/**
 * @brief Supported digest algorithms
 */
enum class checksum_algorithm {
    md5,
    sha256
};

[[nodiscard]] constexpr auto to_string(checksum_algorithm algorithm) noexcept
    -> std::string_view {
    switch (algorithm) {
        case checksum_algorithm::md5: return "md5";
        case checksum_algorithm::sha256: return "sha256";
        default: return "unknown";
    }
}

/**
 * @brief Incremental digest over a byte stream
 *
 * @code
 * digest d(checksum_algorithm::sha256);
 * d.update(first_chunk);
 * d.update(second_chunk);
 * std::string hex = d.finish();
 * @endcode
 */
class digest {
public:
    explicit digest(checksum_algorithm algorithm);
    ~digest();

    digest(const digest&) = delete;
    auto operator=(const digest&) -> digest& = delete;
    digest(digest&&) noexcept;
    auto operator=(digest&&) noexcept -> digest&;

    auto update(std::span<const std::byte> data) -> void;

    /**
     * @brief Finalize and return the lowercase hex digest
     *
     * The object must not be updated afterwards. Returns an empty string
     * if the OpenSSL context could not be initialised.
     */
    [[nodiscard]] auto finish() -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief One-shot digest helpers
 */
class checksum {
public:
    [[nodiscard]] static auto md5(std::span<const std::byte> data) -> std::string;
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Digest of a whole file, streamed in fixed-size blocks
     */
    [[nodiscard]] static auto file_digest(const std::filesystem::path& path,
                                          checksum_algorithm algorithm)
        -> result<std::string>;

    /**
     * @brief Case-insensitive comparison of a file digest with @p expected
     * @return true on match, false on mismatch, error if the file is unreadable
     */
    [[nodiscard]] static auto verify_file(const std::filesystem::path& path,
                                          checksum_algorithm algorithm,
                                          std::string_view expected)
        -> result<bool>;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_CHECKSUM_H

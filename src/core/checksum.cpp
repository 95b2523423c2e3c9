/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities on top of OpenSSL EVP
 */

#include <kcenon/object_transfer/core/checksum.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace kcenon::object_transfer {

namespace {

constexpr std::size_t file_block_size = 64 * 1024;

auto evp_for(checksum_algorithm algorithm) -> const EVP_MD* {
    switch (algorithm) {
        case checksum_algorithm::md5: return EVP_md5();
        case checksum_algorithm::sha256: return EVP_sha256();
        default: return EVP_sha256();
    }
}

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

auto one_shot(checksum_algorithm algorithm, std::span<const std::byte> data)
    -> std::string {
    digest d(algorithm);
    d.update(data);
    return d.finish();
}

}  // namespace

// ============================================================================
// digest
// ============================================================================

struct digest::impl {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{
        EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    bool ready = false;
};

digest::digest(checksum_algorithm algorithm) : impl_(std::make_unique<impl>()) {
    impl_->ready = impl_->ctx &&
                   EVP_DigestInit_ex(impl_->ctx.get(), evp_for(algorithm), nullptr) == 1;
}

digest::~digest() = default;
digest::digest(digest&&) noexcept = default;
auto digest::operator=(digest&&) noexcept -> digest& = default;

auto digest::update(std::span<const std::byte> data) -> void {
    if (impl_->ready && !data.empty()) {
        EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size());
    }
}

auto digest::finish() -> std::string {
    // An empty digest never matches an expected value
    if (!impl_->ready) {
        return {};
    }
    impl_->ready = false;

    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int length = 0;
    EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &length);
    return to_hex(out.data(), length);
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::md5(std::span<const std::byte> data) -> std::string {
    return one_shot(checksum_algorithm::md5, data);
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    return one_shot(checksum_algorithm::sha256, data);
}

auto checksum::file_digest(const std::filesystem::path& path,
                           checksum_algorithm algorithm) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "cannot open for digest: " + path.string()}};
    }

    digest d(algorithm);
    std::vector<char> buffer(file_block_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = file.gcount();
        if (n > 0) {
            d.update(std::as_bytes(std::span(buffer.data(), static_cast<std::size_t>(n))));
        }
    }
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "read failed while hashing: " + path.string()}};
    }

    return d.finish();
}

auto checksum::verify_file(const std::filesystem::path& path,
                           checksum_algorithm algorithm,
                           std::string_view expected) -> result<bool> {
    auto actual = file_digest(path, algorithm);
    if (!actual) {
        return unexpected{actual.error()};
    }

    const auto& hex = actual.value();
    if (hex.size() != expected.size()) {
        return false;
    }
    return std::equal(hex.begin(), hex.end(), expected.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

}  // namespace kcenon::object_transfer

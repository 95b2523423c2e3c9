/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::object_transfer::test {

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("obj_trans_test_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static auto to_bytes(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

// MD5 Tests

TEST_F(ChecksumTest, MD5_EmptyData) {
    EXPECT_EQ(checksum::md5({}), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(ChecksumTest, MD5_KnownValue) {
    EXPECT_EQ(checksum::md5(to_bytes("abc")), "900150983cd24fb0d6963f7d28e17f72");
}

// SHA-256 Tests

TEST_F(ChecksumTest, SHA256_EmptyData) {
    EXPECT_EQ(checksum::sha256({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    EXPECT_EQ(checksum::sha256(to_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, Digest_IncrementalMatchesOneShot) {
    auto data = to_bytes("The quick brown fox jumps over the lazy dog");

    digest d(checksum_algorithm::sha256);
    d.update(std::span<const std::byte>(data).first(10));
    d.update(std::span<const std::byte>(data).subspan(10));

    EXPECT_EQ(d.finish(), checksum::sha256(data));
}

TEST_F(ChecksumTest, Digest_Movable) {
    digest a(checksum_algorithm::md5);
    a.update(to_bytes("ab"));
    digest b(std::move(a));
    b.update(to_bytes("c"));
    EXPECT_EQ(b.finish(), "900150983cd24fb0d6963f7d28e17f72");
}

// File Tests

TEST_F(ChecksumTest, FileDigest_MatchesInMemory) {
    std::vector<std::byte> content(3 * 1024 * 1024 + 17);
    std::mt19937 gen(42);
    for (auto& b : content) {
        b = static_cast<std::byte>(gen() & 0xFF);
    }
    auto path = create_test_file("random.bin", content);

    auto sha = checksum::file_digest(path, checksum_algorithm::sha256);
    ASSERT_TRUE(sha.has_value());
    EXPECT_EQ(sha.value(), checksum::sha256(content));

    auto md5 = checksum::file_digest(path, checksum_algorithm::md5);
    ASSERT_TRUE(md5.has_value());
    EXPECT_EQ(md5.value(), checksum::md5(content));
}

TEST_F(ChecksumTest, FileDigest_MissingFile) {
    auto res = checksum::file_digest(test_dir_ / "missing.bin", checksum_algorithm::md5);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::file_not_found);
}

TEST_F(ChecksumTest, VerifyFile_CaseInsensitive) {
    auto path = create_test_file("abc.txt", to_bytes("abc"));

    auto match = checksum::verify_file(path, checksum_algorithm::md5,
                                       "900150983CD24FB0D6963F7D28E17F72");
    ASSERT_TRUE(match.has_value());
    EXPECT_TRUE(match.value());

    auto mismatch = checksum::verify_file(path, checksum_algorithm::md5,
                                          "00000000000000000000000000000000");
    ASSERT_TRUE(mismatch.has_value());
    EXPECT_FALSE(mismatch.value());
}

}  // namespace kcenon::object_transfer::test

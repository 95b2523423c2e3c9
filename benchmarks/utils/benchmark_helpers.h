/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_OBJECT_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_OBJECT_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::object_transfer::benchmark {

/**
 * @brief Generate random binary data
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch directory whose files are removed on destruction
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Path for a file the benchmark itself will write
     */
    auto reserve_path(const std::string& name) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_object = 1 * MB;
constexpr std::size_t medium_object = 16 * MB;
constexpr std::size_t large_object = 64 * MB;

constexpr std::size_t min_part = 5 * MB;
constexpr std::size_t default_part = 10 * MB;
}  // namespace sizes

}  // namespace kcenon::object_transfer::benchmark

#endif  // KCENON_OBJECT_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

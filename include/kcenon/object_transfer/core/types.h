/**
 * @file types.h
 * @brief Core type definitions for object_trans_system
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_TYPES_H
#define KCENON_OBJECT_TRANSFER_CORE_TYPES_H

#include <kcenon/object_transfer/core/error_codes.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::object_transfer {

/**
 * @brief Error type with code, message and the optional HTTP status the
 *        store observed
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int> status_code;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), status_code(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Opaque identifier of one object transfer
 *
 * Assigned once at task creation and never reused within a process.
 */
struct transfer_id {
    uint64_t value;

    transfer_id() : value(0) {}
    explicit transfer_id(uint64_t v) : value(v) {}

    /**
     * @brief Allocate a new process-unique identifier
     */
    [[nodiscard]] static auto generate() -> transfer_id;

    [[nodiscard]] auto is_null() const noexcept -> bool { return value == 0; }
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const transfer_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const transfer_id& other) const -> bool {
        return value < other.value;
    }
};

}  // namespace kcenon::object_transfer

// Hash support for transfer_id
template <>
struct std::hash<kcenon::object_transfer::transfer_id> {
    auto operator()(const kcenon::object_transfer::transfer_id& id) const noexcept
        -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_OBJECT_TRANSFER_CORE_TYPES_H

/**
 * @file transfer_config.cpp
 * @brief Implementation of transfer_config validation
 */

#include "kcenon/object_transfer/engine/transfer_config.h"

namespace kcenon::object_transfer {

auto transfer_config::validate() const -> result<void> {
    if (max_concurrent_transfers == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "max_concurrent_transfers must be at least 1"}};
    }
    if (part_size_bytes == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "part_size_bytes must be greater than zero"}};
    }
    if (download_buffer_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "download_buffer_size must be greater than zero"}};
    }
    if (request_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "request_timeout must be positive"}};
    }

    auto policy = retry.validate();
    if (!policy) {
        return unexpected{error{error_code::invalid_configuration,
                                "retry policy: " + policy.error().message}};
    }
    return {};
}

}  // namespace kcenon::object_transfer

/**
 * @file memory_object_store.cpp
 * @brief Implementation of memory_object_store
 */

#include "kcenon/object_transfer/storage/memory_object_store.h"

#include "kcenon/object_transfer/core/checksum.h"
#include "kcenon/object_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>

namespace kcenon::object_transfer {

namespace {

struct stored_object {
    std::shared_ptr<const std::vector<std::byte>> data;
    std::string etag;
    std::string sha256;
    std::optional<std::string> md5;
    std::chrono::system_clock::time_point last_modified;
};

struct stored_part {
    std::vector<std::byte> data;
    std::string etag;
};

struct open_upload {
    std::string key;
    std::map<uint32_t, stored_part> parts;
};

auto hex_to_bytes(const std::string& hex) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::byte>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

auto make_object(std::vector<std::byte> data, std::string etag,
                 std::optional<std::string> md5) -> stored_object {
    stored_object obj;
    obj.sha256 = checksum::sha256(data);
    obj.data = std::make_shared<const std::vector<std::byte>>(std::move(data));
    obj.etag = std::move(etag);
    obj.md5 = std::move(md5);
    obj.last_modified = std::chrono::system_clock::now();
    return obj;
}

auto stop_error(const request_context& ctx) -> std::optional<error> {
    if (ctx.token && ctx.token->is_stop_requested()) {
        return ctx.token->to_error();
    }
    return std::nullopt;
}

auto no_such_key(const std::string& key) -> error {
    return error{error_code::object_not_found, "NoSuchKey: " + key, 404};
}

auto no_such_upload(const std::string& upload_id) -> error {
    return error{error_code::upload_not_found, "NoSuchUpload: " + upload_id, 404};
}

/**
 * @brief Stream over an immutable snapshot of the object
 */
class memory_read_stream : public object_read_stream {
public:
    memory_read_stream(std::shared_ptr<const std::vector<std::byte>> data,
                       uint64_t start,
                       const cancellation_token* token)
        : data_(std::move(data)), position_(start), token_(token) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer)
        -> result<std::size_t> override {
        if (token_ && token_->is_stop_requested()) {
            return unexpected{token_->to_error()};
        }
        auto remaining = data_->size() - static_cast<std::size_t>(position_);
        auto n = std::min(remaining, buffer.size());
        std::copy_n(data_->begin() + static_cast<std::ptrdiff_t>(position_), n,
                    buffer.begin());
        position_ += n;
        return n;
    }

    [[nodiscard]] auto position() const -> uint64_t override { return position_; }

private:
    std::shared_ptr<const std::vector<std::byte>> data_;
    uint64_t position_;
    const cancellation_token* token_;
};

}  // namespace

struct memory_object_store::impl {
    mutable std::mutex mutex;
    std::unordered_map<std::string, stored_object> objects;
    std::unordered_map<std::string, open_upload> uploads;
    std::atomic<uint64_t> next_upload{1};
};

memory_object_store::memory_object_store() : impl_(std::make_unique<impl>()) {}

memory_object_store::~memory_object_store() = default;

auto memory_object_store::head_object(const std::string& key,
                                      const request_context& ctx)
    -> result<object_metadata> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        return unexpected{no_such_key(key)};
    }

    object_metadata meta;
    meta.key = key;
    meta.size = it->second.data->size();
    meta.etag = it->second.etag;
    meta.last_modified = it->second.last_modified;
    meta.content_sha256 = it->second.sha256;
    meta.content_md5 = it->second.md5;
    return meta;
}

auto memory_object_store::put_object(const std::string& key,
                                     std::span<const std::byte> data,
                                     const request_context& ctx)
    -> result<std::string> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }

    auto md5 = checksum::md5(data);
    auto obj = make_object(std::vector<std::byte>(data.begin(), data.end()), md5, md5);

    std::lock_guard lock(impl_->mutex);
    impl_->objects[key] = std::move(obj);
    return md5;
}

auto memory_object_store::create_multipart_upload(const std::string& key,
                                                  const request_context& ctx)
    -> result<std::string> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }

    auto upload_id = "upload-" + std::to_string(impl_->next_upload.fetch_add(1));

    std::lock_guard lock(impl_->mutex);
    impl_->uploads[upload_id] = open_upload{key, {}};
    return upload_id;
}

auto memory_object_store::upload_part(const std::string& key,
                                      const std::string& upload_id,
                                      uint32_t part_number,
                                      std::span<const std::byte> data,
                                      const request_context& ctx)
    -> result<std::string> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }
    if (part_number == 0) {
        return unexpected{error{error_code::invalid_argument,
                                "part numbers start at 1", 400}};
    }

    stored_part part;
    part.data.assign(data.begin(), data.end());
    part.etag = checksum::md5(data);
    auto etag = part.etag;

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    if (it == impl_->uploads.end() || it->second.key != key) {
        return unexpected{no_such_upload(upload_id)};
    }
    it->second.parts[part_number] = std::move(part);
    return etag;
}

auto memory_object_store::list_parts(const std::string& key,
                                     const std::string& upload_id,
                                     const request_context& ctx)
    -> result<std::vector<uploaded_part>> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    if (it == impl_->uploads.end() || it->second.key != key) {
        return unexpected{no_such_upload(upload_id)};
    }

    std::vector<uploaded_part> out;
    out.reserve(it->second.parts.size());
    for (const auto& [number, part] : it->second.parts) {
        out.push_back(uploaded_part{number, part.etag, part.data.size()});
    }
    return out;
}

auto memory_object_store::complete_multipart_upload(
    const std::string& key,
    const std::string& upload_id,
    const std::vector<completed_part>& parts,
    const request_context& ctx) -> result<std::string> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }
    if (parts.empty()) {
        return unexpected{error{error_code::invalid_argument,
                                "MalformedXML: no parts", 400}};
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    if (it == impl_->uploads.end() || it->second.key != key) {
        return unexpected{no_such_upload(upload_id)};
    }

    std::vector<std::byte> assembled;
    digest etag_digest(checksum_algorithm::md5);
    uint32_t previous = 0;

    for (const auto& ref : parts) {
        if (ref.part_number <= previous) {
            return unexpected{error{error_code::invalid_argument,
                                    "InvalidPartOrder", 400}};
        }
        previous = ref.part_number;

        auto part = it->second.parts.find(ref.part_number);
        if (part == it->second.parts.end() || part->second.etag != ref.etag) {
            return unexpected{error{error_code::invalid_argument,
                                    "InvalidPart: " + std::to_string(ref.part_number),
                                    400}};
        }
        assembled.insert(assembled.end(), part->second.data.begin(),
                         part->second.data.end());
        etag_digest.update(hex_to_bytes(part->second.etag));
    }

    auto etag = etag_digest.finish() + "-" + std::to_string(parts.size());
    impl_->objects[key] = make_object(std::move(assembled), etag, std::nullopt);
    impl_->uploads.erase(it);

    OT_LOG_DEBUG(log_category::store, "completed multipart upload " + upload_id);
    return etag;
}

auto memory_object_store::abort_multipart_upload(const std::string& key,
                                                 const std::string& upload_id,
                                                 const request_context& /*ctx*/)
    -> result<void> {
    // Abort is not interrupted by a stop request; it is how cancel cleans up
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    if (it == impl_->uploads.end() || it->second.key != key) {
        return unexpected{no_such_upload(upload_id)};
    }
    impl_->uploads.erase(it);
    return {};
}

auto memory_object_store::get_object_range(const std::string& key,
                                           uint64_t start_byte,
                                           const request_context& ctx)
    -> result<std::unique_ptr<object_read_stream>> {
    if (auto stop = stop_error(ctx)) {
        return unexpected{*stop};
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        return unexpected{no_such_key(key)};
    }
    if (start_byte > it->second.data->size()) {
        return unexpected{error{error_code::http_error, "InvalidRange", 416}};
    }

    return std::unique_ptr<object_read_stream>(
        std::make_unique<memory_read_stream>(it->second.data, start_byte, ctx.token));
}

auto memory_object_store::seed_object(const std::string& key,
                                      std::vector<std::byte> data) -> void {
    auto md5 = checksum::md5(data);
    auto obj = make_object(std::move(data), md5, md5);
    std::lock_guard lock(impl_->mutex);
    impl_->objects[key] = std::move(obj);
}

auto memory_object_store::replace_object(const std::string& key,
                                         std::vector<std::byte> data) -> void {
    seed_object(key, std::move(data));
}

auto memory_object_store::object_data(const std::string& key) const
    -> std::optional<std::vector<std::byte>> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->objects.find(key);
    if (it == impl_->objects.end()) {
        return std::nullopt;
    }
    return *it->second.data;
}

auto memory_object_store::contains(const std::string& key) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->objects.count(key) > 0;
}

auto memory_object_store::object_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->objects.size();
}

auto memory_object_store::has_upload(const std::string& upload_id) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->uploads.count(upload_id) > 0;
}

auto memory_object_store::open_upload_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->uploads.size();
}

}  // namespace kcenon::object_transfer

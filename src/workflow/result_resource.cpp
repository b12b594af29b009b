/**
 * @file result_resource.cpp
 * @brief Memory and temp-file result handles
 * @version 0.1.0
 */

#include "kcenon/stylize/workflow/result_resource.h"
#include "kcenon/stylize/core/logging.h"
#include "kcenon/stylize/workflow/workflow_types.h"

#include <fstream>
#include <iterator>

namespace kcenon::stylize {

// ============================================================================
// memory_resource
// ============================================================================

memory_resource::memory_resource(std::string id, std::vector<uint8_t> bytes,
                                 std::string content_type)
    : uri_("mem://" + id),
      content_type_(std::move(content_type)),
      bytes_(std::move(bytes)) {
    size_ = bytes_.size();
}

memory_resource::~memory_resource() {
    release();
}

auto memory_resource::data() const -> result<std::vector<uint8_t>> {
    if (released_) {
        return unexpected{error{error_code::invalid_state,
            "Resource already released: " + uri_}};
    }
    return bytes_;
}

void memory_resource::release() {
    if (released_) {
        return;
    }
    std::vector<uint8_t>().swap(bytes_);
    released_ = true;
}

// ============================================================================
// temp_file_resource
// ============================================================================

temp_file_resource::temp_file_resource(std::filesystem::path path, uint64_t size,
                                       std::string content_type)
    : path_(std::move(path)),
      uri_("file://" + path_.string()),
      content_type_(std::move(content_type)),
      size_(size) {}

auto temp_file_resource::create(const std::filesystem::path& directory,
                                const std::string& file_name,
                                const std::vector<uint8_t>& bytes,
                                std::string content_type)
    -> result<std::unique_ptr<temp_file_resource>> {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
            "Failed to create directory " + directory.string() + ": " + ec.message()}};
    }

    auto path = directory / file_name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::file_write_error,
            "Failed to create file: " + path.string()}};
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        std::filesystem::remove(path, ec);
        return unexpected{error{error_code::file_write_error,
            "Failed to write file: " + path.string()}};
    }

    return std::unique_ptr<temp_file_resource>(
        new temp_file_resource(std::move(path), bytes.size(), std::move(content_type)));
}

temp_file_resource::~temp_file_resource() {
    release();
}

auto temp_file_resource::data() const -> result<std::vector<uint8_t>> {
    if (released_) {
        return unexpected{error{error_code::invalid_state,
            "Resource already released: " + uri_}};
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return unexpected{error{error_code::file_read_error,
            "Failed to open file: " + path_.string()}};
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    return bytes;
}

void temp_file_resource::release() {
    if (released_) {
        return;
    }
    released_ = true;

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        STYLIZE_LOG_WARN(log_category::resource,
                         "Failed to delete result file " + path_.string() + ": " + ec.message());
    }
}

// ============================================================================
// Factories
// ============================================================================

auto make_memory_materializer() -> resource_materializer {
    return [](const std::string& id, const std::string& /*object_key*/,
              std::vector<uint8_t> bytes, const std::string& content_type)
               -> result<std::unique_ptr<materialized_resource>> {
        return std::unique_ptr<materialized_resource>(
            std::make_unique<memory_resource>(id, std::move(bytes), content_type));
    };
}

auto make_temp_file_materializer(std::filesystem::path directory) -> resource_materializer {
    return [directory = std::move(directory)](
               const std::string& id, const std::string& object_key,
               std::vector<uint8_t> bytes, const std::string& content_type)
               -> result<std::unique_ptr<materialized_resource>> {
        auto dir = directory;
        if (dir.empty()) {
            std::error_code ec;
            dir = std::filesystem::temp_directory_path(ec);
            if (ec) {
                return unexpected{error{error_code::file_write_error,
                    "No temporary directory available: " + ec.message()}};
            }
        }

        auto slash = object_key.rfind('/');
        auto base = slash == std::string::npos ? object_key : object_key.substr(slash + 1);
        auto created = temp_file_resource::create(
            dir, "stylize-" + id + "-" + sanitize_filename(base), bytes, content_type);
        if (!created) {
            return unexpected{created.error()};
        }
        return std::unique_ptr<materialized_resource>(std::move(created.value()));
    };
}

}  // namespace kcenon::stylize

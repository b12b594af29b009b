/**
 * @file result_resource.h
 * @brief Locally resolvable handles for downloaded results
 * @version 0.1.0
 *
 * A materialized_resource owns the bytes of one downloaded object until it is
 * released. The engine holds at most one and releases it before creating the
 * next, on reset and on destruction.
 */

#ifndef KCENON_STYLIZE_WORKFLOW_RESULT_RESOURCE_H
#define KCENON_STYLIZE_WORKFLOW_RESULT_RESOURCE_H

#include "kcenon/stylize/core/types.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::stylize {

/**
 * @brief Opaque handle to downloaded bytes
 */
class materialized_resource {
public:
    virtual ~materialized_resource() = default;

    /**
     * @brief URI that resolves to the bytes while the resource is alive
     */
    [[nodiscard]] virtual auto uri() const -> const std::string& = 0;

    [[nodiscard]] virtual auto content_type() const -> const std::string& = 0;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read the bytes back; fails once released
     */
    [[nodiscard]] virtual auto data() const -> result<std::vector<uint8_t>> = 0;

    /**
     * @brief Free the underlying storage; idempotent
     */
    virtual void release() = 0;

    [[nodiscard]] virtual auto is_released() const -> bool = 0;
};

/**
 * @brief In-memory buffer addressed as mem://<uuid>
 */
class memory_resource : public materialized_resource {
public:
    memory_resource(std::string id, std::vector<uint8_t> bytes, std::string content_type);
    ~memory_resource() override;

    [[nodiscard]] auto uri() const -> const std::string& override { return uri_; }
    [[nodiscard]] auto content_type() const -> const std::string& override {
        return content_type_;
    }
    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    [[nodiscard]] auto data() const -> result<std::vector<uint8_t>> override;
    void release() override;
    [[nodiscard]] auto is_released() const -> bool override { return released_; }

private:
    std::string uri_;
    std::string content_type_;
    std::vector<uint8_t> bytes_;
    uint64_t size_ = 0;
    bool released_ = false;
};

/**
 * @brief Temporary file addressed as file://<path>; deleted on release
 */
class temp_file_resource : public materialized_resource {
public:
    /**
     * @brief Write bytes to a new file in the given directory
     */
    [[nodiscard]] static auto create(const std::filesystem::path& directory,
                                     const std::string& file_name,
                                     const std::vector<uint8_t>& bytes,
                                     std::string content_type)
        -> result<std::unique_ptr<temp_file_resource>>;

    ~temp_file_resource() override;

    temp_file_resource(const temp_file_resource&) = delete;
    auto operator=(const temp_file_resource&) -> temp_file_resource& = delete;

    [[nodiscard]] auto uri() const -> const std::string& override { return uri_; }
    [[nodiscard]] auto content_type() const -> const std::string& override {
        return content_type_;
    }
    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    [[nodiscard]] auto data() const -> result<std::vector<uint8_t>> override;
    void release() override;
    [[nodiscard]] auto is_released() const -> bool override { return released_; }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    temp_file_resource(std::filesystem::path path, uint64_t size, std::string content_type);

    std::filesystem::path path_;
    std::string uri_;
    std::string content_type_;
    uint64_t size_ = 0;
    bool released_ = false;
};

/**
 * @brief Factory turning downloaded bytes into a resource
 *
 * Arguments: unique id, derived object key, bytes, content type.
 */
using resource_materializer = std::function<result<std::unique_ptr<materialized_resource>>(
    const std::string& id,
    const std::string& object_key,
    std::vector<uint8_t> bytes,
    const std::string& content_type)>;

/**
 * @brief Materializer producing memory_resource handles
 */
[[nodiscard]] auto make_memory_materializer() -> resource_materializer;

/**
 * @brief Materializer writing temp files under the given directory
 *
 * An empty directory selects std::filesystem::temp_directory_path().
 */
[[nodiscard]] auto make_temp_file_materializer(std::filesystem::path directory = {})
    -> resource_materializer;

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_WORKFLOW_RESULT_RESOURCE_H

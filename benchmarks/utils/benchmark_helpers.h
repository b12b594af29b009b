/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_STYLIZE_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_STYLIZE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/stylize/cloud/cloud_credentials.h>
#include <kcenon/stylize/cloud/cloud_http_client.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::stylize::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<uint8_t>;
};

/**
 * @brief Fixed credentials for signing benchmarks
 */
auto benchmark_credentials() -> credentials;

/**
 * @brief HTTP client answering every call in memory
 *
 * HEAD returns 404 for the first `misses` calls after reset(), then 200.
 */
class in_memory_http_client : public http_client_interface_base {
public:
    explicit in_memory_http_client(std::vector<uint8_t> object = {});

    void reset(uint32_t misses);

    auto get(const std::string& url, const std::map<std::string, std::string>& headers)
        -> result<http_response_base> override;

    auto put(const std::string& url,
             const std::vector<uint8_t>& body,
             const std::map<std::string, std::string>& headers)
        -> result<http_response_base> override;

    auto head(const std::string& url, const std::map<std::string, std::string>& headers)
        -> result<http_response_base> override;

private:
    std::vector<uint8_t> object_;
    uint32_t misses_ = 0;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t thumbnail = 16 * KB;
constexpr std::size_t photo = 2 * MB;
constexpr std::size_t large_photo = 12 * MB;
}  // namespace sizes

}  // namespace kcenon::stylize::benchmark

#endif  // KCENON_STYLIZE_BENCHMARKS_BENCHMARK_HELPERS_H

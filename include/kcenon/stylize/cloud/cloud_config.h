/**
 * @file cloud_config.h
 * @brief S3 endpoint configuration
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_CLOUD_CLOUD_CONFIG_H
#define KCENON_STYLIZE_CLOUD_CLOUD_CONFIG_H

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::stylize {

/**
 * @brief Where signed requests are sent
 *
 * Requests use virtual-hosted addressing: `<bucket>.<storage host>`. The
 * default storage host is `s3.<region>.amazonaws.com`; an override allows
 * S3-compatible services and the legacy global endpoint.
 */
struct s3_endpoint_config {
    /// Service name used in the credential scope
    std::string service = "s3";

    /// Storage host without bucket, e.g. "s3.amazonaws.com"
    std::optional<std::string> storage_host;

    /// URL scheme
    std::string scheme = "https";

    /// Per-request HTTP timeout for the production client
    std::chrono::milliseconds request_timeout{30000};

    /**
     * @brief Storage host for the given region
     */
    [[nodiscard]] auto host_for_region(const std::string& region) const -> std::string {
        if (storage_host && !storage_host->empty()) {
            return *storage_host;
        }
        return service + "." + region + ".amazonaws.com";
    }
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_CLOUD_CLOUD_CONFIG_H

/**
 * @file cloud_credentials.cpp
 * @brief Credential helpers
 * @version 0.1.0
 */

#include "kcenon/stylize/cloud/cloud_credentials.h"
#include "kcenon/stylize/cloud/cloud_utils.h"

namespace kcenon::stylize {

auto credentials::is_complete() const -> bool {
    return !cloud_utils::trim(region).empty() &&
           !cloud_utils::trim(access_key_id).empty() &&
           !cloud_utils::trim(secret_access_key).empty();
}

auto credentials::trimmed() const -> credentials {
    credentials out;
    out.region = cloud_utils::trim(region);
    out.access_key_id = cloud_utils::trim(access_key_id);
    out.secret_access_key = cloud_utils::trim(secret_access_key);
    if (session_token) {
        auto token = cloud_utils::trim(*session_token);
        if (!token.empty()) {
            out.session_token = std::move(token);
        }
    }
    return out;
}

}  // namespace kcenon::stylize

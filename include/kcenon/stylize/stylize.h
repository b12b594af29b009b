/**
 * @file stylize.h
 * @brief Main header for the stylize_client library
 * @version 0.1.0
 *
 * Include this header to access the workflow engine, the S3 transport and
 * the SigV4 signer.
 *
 * @code
 * #include <kcenon/stylize/stylize.h>
 *
 * using namespace kcenon::stylize;
 *
 * auto engine = stylize_workflow::builder().build();
 * @endcode
 */

#ifndef KCENON_STYLIZE_STYLIZE_H
#define KCENON_STYLIZE_STYLIZE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/stylize/core/types.h"
#include "kcenon/stylize/core/activity_log.h"
#include "kcenon/stylize/core/cancellation.h"
#include "kcenon/stylize/core/logging.h"
#include "kcenon/stylize/core/scheduler.h"

// Cloud
#include "kcenon/stylize/cloud/cloud_utils.h"
#include "kcenon/stylize/cloud/request_signer.h"
#include "kcenon/stylize/cloud/s3_transport.h"

// Workflow
#include "kcenon/stylize/workflow/result_resource.h"
#include "kcenon/stylize/workflow/stylize_workflow.h"
#include "kcenon/stylize/workflow/workflow_types.h"

namespace kcenon::stylize {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_STYLIZE_H

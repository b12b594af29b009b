/**
 * @file stylize_workflow.h
 * @brief Upload-then-poll workflow engine
 * @version 0.1.0
 */

#ifndef KCENON_STYLIZE_WORKFLOW_STYLIZE_WORKFLOW_H
#define KCENON_STYLIZE_WORKFLOW_STYLIZE_WORKFLOW_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/stylize/cloud/cloud_config.h"
#include "kcenon/stylize/cloud/cloud_http_client.h"
#include "kcenon/stylize/core/activity_log.h"
#include "kcenon/stylize/core/scheduler.h"
#include "kcenon/stylize/core/types.h"
#include "kcenon/stylize/workflow/result_resource.h"
#include "kcenon/stylize/workflow/workflow_types.h"

namespace kcenon::stylize {

/**
 * @brief Uploads a source image, waits for the stylized copy and downloads it
 *
 * One run is active at a time. start() supersedes any active run; every step
 * of a run executes on the injected scheduler, and the wait between polls is
 * a delayed post rather than a blocked thread.
 *
 * @code
 * auto engine = stylize_workflow::builder()
 *     .with_config(workflow_config{})
 *     .build();
 *
 * if (engine.has_value()) {
 *     auto& wf = engine.value();
 *     wf.on_state_changed([](workflow_state s) { std::cout << status_message(s); });
 *     wf.start(request);
 * }
 * @endcode
 */
class stylize_workflow {
public:
    using id_generator = std::function<std::string()>;
    using clock_function = std::function<std::chrono::system_clock::time_point()>;
    using state_callback = std::function<void(workflow_state)>;
    using log_callback = std::function<void(const log_entry&)>;
    using result_callback =
        std::function<void(const std::string& uri, const std::string& content_type)>;

    /**
     * @brief Builder for stylize_workflow
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set prefixes, poll interval and attempt limit
         */
        auto with_config(workflow_config config) -> builder&;

        /**
         * @brief Set S3 endpoint (storage host override, scheme)
         */
        auto with_endpoint(s3_endpoint_config endpoint) -> builder&;

        /**
         * @brief Set scheduler (default: a private event_loop_scheduler)
         */
        auto with_scheduler(std::shared_ptr<scheduler> sched) -> builder&;

        /**
         * @brief Set HTTP client (default: cloud_http_client)
         */
        auto with_http_client(std::shared_ptr<http_client_interface_base> client)
            -> builder&;

        /**
         * @brief Set unique id source for object keys (default: UUID v4)
         */
        auto with_id_generator(id_generator generator) -> builder&;

        /**
         * @brief Set signing clock (default: system_clock::now)
         */
        auto with_clock(clock_function clock) -> builder&;

        /**
         * @brief Set result materializer (default: in-memory)
         */
        auto with_materializer(resource_materializer materializer) -> builder&;

        /**
         * @brief Build the engine
         * @return Engine, or validation_failed for an unusable configuration
         */
        [[nodiscard]] auto build() -> result<stylize_workflow>;

    private:
        workflow_config config_;
        s3_endpoint_config endpoint_;
        std::shared_ptr<scheduler> scheduler_;
        std::shared_ptr<http_client_interface_base> http_client_;
        id_generator id_generator_;
        clock_function clock_;
        resource_materializer materializer_;
    };

    // Non-copyable, movable
    stylize_workflow(const stylize_workflow&) = delete;
    auto operator=(const stylize_workflow&) -> stylize_workflow& = delete;
    stylize_workflow(stylize_workflow&&) noexcept;
    auto operator=(stylize_workflow&&) noexcept -> stylize_workflow&;
    ~stylize_workflow();

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Begin a new run, cancelling any active one
     *
     * Clears the activity log and releases the previous result before the
     * run is scheduled. Progress is reported through state, log and callbacks.
     */
    void start(stylize_request request);

    /**
     * @brief Abort the active run
     *
     * The run stops at its next check point, logs "Workflow aborted by user."
     * and returns to idle.
     * @return true if a run was active
     */
    auto cancel() -> bool;

    /**
     * @brief Cancel any run, clear the log, release the result and go idle
     */
    void reset();

    // ========================================================================
    // Observation
    // ========================================================================

    [[nodiscard]] auto state() const -> workflow_state;

    [[nodiscard]] auto status_message() const -> std::string_view;

    [[nodiscard]] auto is_busy() const -> bool;

    [[nodiscard]] auto log_entries() const -> std::vector<log_entry>;

    /**
     * @brief Error that ended the most recent run, if any
     */
    [[nodiscard]] auto last_error() const -> std::optional<error>;

    [[nodiscard]] auto has_result() const -> bool;

    [[nodiscard]] auto result_uri() const -> std::optional<std::string>;

    [[nodiscard]] auto result_content_type() const -> std::optional<std::string>;

    /**
     * @brief Bytes of the current result
     */
    [[nodiscard]] auto result_data() const -> result<std::vector<uint8_t>>;

    /**
     * @brief Key of the uploaded source object of the latest run
     */
    [[nodiscard]] auto uploaded_key() const -> std::optional<std::string>;

    /**
     * @brief Key polled in the destination bucket for the latest run
     */
    [[nodiscard]] auto output_key() const -> std::optional<std::string>;

    [[nodiscard]] auto config() const -> const workflow_config&;

    // ========================================================================
    // Callbacks
    // ========================================================================

    /**
     * @brief Called after every state change, outside internal locks
     */
    void on_state_changed(state_callback callback);

    /**
     * @brief Called for every appended log entry, in order
     */
    void on_log_entry(log_callback callback);

    /**
     * @brief Called when a result has been materialized
     */
    void on_result(result_callback callback);

private:
    struct impl;
    explicit stylize_workflow(std::shared_ptr<impl> state);

    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::stylize

#endif  // KCENON_STYLIZE_WORKFLOW_STYLIZE_WORKFLOW_H

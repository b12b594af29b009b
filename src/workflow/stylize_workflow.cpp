/**
 * @file stylize_workflow.cpp
 * @brief Upload-then-poll workflow engine implementation
 * @version 0.1.0
 */

#include "kcenon/stylize/workflow/stylize_workflow.h"

#include "kcenon/stylize/cloud/cloud_utils.h"
#include "kcenon/stylize/cloud/s3_transport.h"
#include "kcenon/stylize/core/cancellation.h"
#include "kcenon/stylize/core/logging.h"

#include <deque>
#include <map>
#include <mutex>
#include <utility>

namespace kcenon::stylize {

namespace {

constexpr const char* msg_missing_file = "Please choose an image to upload.";
constexpr const char* msg_missing_credentials =
    "Region, access key ID, and secret access key are required.";
constexpr const char* msg_missing_source_bucket =
    "Please provide the source bucket that triggers the Lambda.";
constexpr const char* msg_missing_destination_bucket =
    "Please provide the destination bucket for stylized assets.";
constexpr const char* msg_waiting = "Upload complete. Waiting for stylized output...";
constexpr const char* msg_found = "Stylized asset found. Downloading...";
constexpr const char* msg_downloaded = "Stylized image downloaded successfully.";
constexpr const char* msg_timeout = "Timed out waiting for stylized image.";
constexpr const char* msg_aborted = "Workflow aborted by user.";

/**
 * @brief State of one run, shared by every step scheduled for it
 */
struct run_context {
    std::string correlation_id;
    cancellation_source cancel;
    cancellation_token token;
    bool finished = false;  // guarded by impl::mutex

    std::shared_ptr<s3_transport> transport;
    stylize_request request;
    std::string source_bucket;
    std::string destination_bucket;
    std::string object_key;
    std::string output_key;
    uint32_t attempt = 0;
    std::optional<std::string> probe_content_type;
};

/**
 * @brief Notifications collected under the lock and delivered after it
 */
struct pending_events {
    std::optional<workflow_state> state;
    std::vector<log_entry> entries;
    std::optional<std::pair<std::string, std::string>> result;
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct stylize_workflow::impl : std::enable_shared_from_this<impl> {
    workflow_config config;
    s3_endpoint_config endpoint;
    std::shared_ptr<scheduler> sched;
    std::shared_ptr<http_client_interface_base> http_client;
    id_generator make_id;
    clock_function clock;
    resource_materializer materializer;

    mutable std::mutex mutex;
    workflow_state current_state = workflow_state::idle;
    activity_log log;
    std::unique_ptr<materialized_resource> current_result;
    std::optional<error> last_error;
    std::optional<std::string> last_object_key;
    std::optional<std::string> last_output_key;
    std::shared_ptr<run_context> active;
    std::deque<pending_events> outbox;
    bool delivering = false;

    std::mutex callback_mutex;
    state_callback state_cb;
    log_callback log_cb;
    result_callback result_cb;

    // ------------------------------------------------------------------------
    // Locked helpers (caller holds mutex)
    // ------------------------------------------------------------------------

    auto is_live_locked(const run_context& ctx) const -> bool {
        return active.get() == &ctx && !ctx.finished;
    }

    void set_state_locked(workflow_state next, pending_events& events) {
        if (current_state != next) {
            current_state = next;
            events.state = next;
        }
    }

    void append_locked(const run_context* ctx, const std::string& message, log_level level,
                       pending_events& events) {
        events.entries.push_back(log.append(message));

        workflow_log_context log_ctx;
        if (ctx) {
            log_ctx.run_id = ctx->correlation_id;
            log_ctx.bucket = ctx->destination_bucket.empty() || ctx->attempt == 0
                ? ctx->source_bucket : ctx->destination_bucket;
            log_ctx.object_key = ctx->attempt == 0 ? ctx->object_key : ctx->output_key;
            if (ctx->attempt > 0) {
                log_ctx.attempt = ctx->attempt;
                log_ctx.max_attempts = config.max_poll_attempts;
            }
        }
        log_ctx.state = std::string(to_string(current_state));
        STYLIZE_LOG_CTX(level, log_category::workflow, message, log_ctx);
    }

    void finish_locked(run_context& ctx) {
        ctx.finished = true;
        if (active.get() == &ctx) {
            active.reset();
        }
    }

    void post_events_locked(pending_events events) {
        if (events.state || !events.entries.empty() || events.result) {
            outbox.push_back(std::move(events));
        }
    }

    void release_result_locked() {
        if (current_result) {
            current_result->release();
            current_result.reset();
        }
    }

    // ------------------------------------------------------------------------
    // Event delivery
    // ------------------------------------------------------------------------

    /**
     * @brief Deliver queued notifications in the order they were committed
     *
     * Only one thread delivers at a time. Events posted meanwhile, including
     * from inside a callback, are delivered by that thread after the current
     * callback returns.
     */
    void deliver_pending() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (delivering) {
                return;
            }
            delivering = true;
        }
        while (true) {
            pending_events next;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (outbox.empty()) {
                    delivering = false;
                    return;
                }
                next = std::move(outbox.front());
                outbox.pop_front();
            }
            try {
                dispatch(next);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                delivering = false;
                throw;
            }
        }
    }

    void dispatch(const pending_events& events) {
        state_callback on_state;
        log_callback on_log;
        result_callback on_res;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            on_state = state_cb;
            on_log = log_cb;
            on_res = result_cb;
        }

        if (on_log) {
            for (const auto& entry : events.entries) {
                on_log(entry);
            }
        }
        if (events.state && on_state) {
            on_state(*events.state);
        }
        if (events.result && on_res) {
            on_res(events.result->first, events.result->second);
        }
    }

    /**
     * @brief Log a message and optionally move to a state, if the run is live
     * @return false when the run was superseded or already finished
     */
    auto advance(run_context& ctx, const std::string& message,
                 std::optional<workflow_state> next = std::nullopt) -> bool {
        pending_events events;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_live_locked(ctx)) {
                return false;
            }
            if (next) {
                set_state_locked(*next, events);
            }
            append_locked(&ctx, message, log_level::info, events);
            post_events_locked(std::move(events));
        }
        deliver_pending();
        return true;
    }

    /**
     * @brief End the run in the error state
     */
    void fail(run_context& ctx, const std::string& message, error err) {
        pending_events events;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_live_locked(ctx)) {
                return;
            }
            set_state_locked(workflow_state::error, events);
            append_locked(&ctx, message, log_level::error, events);
            last_error = std::move(err);
            finish_locked(ctx);
            post_events_locked(std::move(events));
        }
        deliver_pending();
    }

    /**
     * @brief End the run in idle after a user abort
     */
    void abort_run(run_context& ctx) {
        pending_events events;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_live_locked(ctx)) {
                return;
            }
            set_state_locked(workflow_state::idle, events);
            append_locked(&ctx, msg_aborted, log_level::info, events);
            last_error = error{error_code::operation_cancelled, msg_aborted};
            finish_locked(ctx);
            post_events_locked(std::move(events));
        }
        deliver_pending();
    }

    auto is_live(const run_context& ctx) const -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        return is_live_locked(ctx);
    }

    /**
     * @brief Stop silently if superseded, or abort if cancelled
     * @return true when the step may continue
     */
    auto checkpoint(run_context& ctx) -> bool {
        if (!is_live(ctx)) {
            return false;
        }
        if (ctx.token.is_cancelled()) {
            abort_run(ctx);
            return false;
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Scheduling
    // ------------------------------------------------------------------------

    template <typename Step>
    void schedule(const std::shared_ptr<run_context>& ctx, Step step,
                  std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        std::weak_ptr<impl> weak = shared_from_this();
        auto task = [weak, ctx, step]() {
            if (auto self = weak.lock()) {
                ((*self).*step)(ctx);
            }
        };
        if (delay.count() > 0) {
            sched->post_delayed(std::move(task), delay);
        } else {
            sched->post(std::move(task));
        }
    }

    // ------------------------------------------------------------------------
    // Control
    // ------------------------------------------------------------------------

    void start(stylize_request request) {
        auto ctx = std::make_shared<run_context>();
        ctx->correlation_id = cloud_utils::generate_uuid();
        ctx->token = ctx->cancel.token();
        ctx->request = std::move(request);

        {
            std::lock_guard<std::mutex> lock(mutex);
            if (active) {
                active->cancel.cancel();
                finish_locked(*active);
            }
            active = ctx;
            release_result_locked();
            log.clear();
            last_error.reset();
            last_object_key.reset();
            last_output_key.reset();
        }

        schedule(ctx, &impl::begin_run);
    }

    auto cancel() -> bool {
        std::shared_ptr<run_context> ctx;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!active || active->finished) {
                return false;
            }
            ctx = active;
        }
        ctx->cancel.cancel();
        // Observed immediately unless a step is running, in which case that
        // step observes it when its HTTP call returns
        schedule(ctx, &impl::observe_cancel);
        return true;
    }

    void reset() {
        pending_events events;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (active) {
                active->cancel.cancel();
                finish_locked(*active);
            }
            release_result_locked();
            log.clear();
            last_error.reset();
            last_object_key.reset();
            last_output_key.reset();
            set_state_locked(workflow_state::idle, events);
            post_events_locked(std::move(events));
        }
        deliver_pending();
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex);
        if (active) {
            active->cancel.cancel();
            finish_locked(*active);
        }
        release_result_locked();
    }

    // ------------------------------------------------------------------------
    // Steps
    // ------------------------------------------------------------------------

    void observe_cancel(std::shared_ptr<run_context> ctx) {
        checkpoint(*ctx);
    }

    void begin_run(std::shared_ptr<run_context> ctx) {
        if (!checkpoint(*ctx)) {
            return;
        }
        auto& req = ctx->request;

        if (!req.file) {
            fail(*ctx, msg_missing_file, error{error_code::missing_file, msg_missing_file});
            return;
        }

        if (!advance(*ctx, "Preparing to upload " + req.file->name,
                     workflow_state::preparing)) {
            return;
        }

        auto creds = req.creds.trimmed();
        if (!creds.is_complete()) {
            fail(*ctx, msg_missing_credentials,
                 error{error_code::missing_credentials, msg_missing_credentials});
            return;
        }

        ctx->source_bucket = cloud_utils::trim(req.input_bucket);
        if (ctx->source_bucket.empty()) {
            fail(*ctx, msg_missing_source_bucket,
                 error{error_code::missing_source_bucket, msg_missing_source_bucket});
            return;
        }

        ctx->destination_bucket = cloud_utils::trim(req.output_bucket);
        if (ctx->destination_bucket.empty()) {
            fail(*ctx, msg_missing_destination_bucket,
                 error{error_code::missing_destination_bucket, msg_missing_destination_bucket});
            return;
        }

        auto unique_id = make_id();
        auto input_prefix = resolve_prefix(req.input_prefix, config.input_prefix);
        auto output_prefix = resolve_prefix(req.output_prefix, config.output_prefix);
        ctx->object_key = derive_object_key(input_prefix, unique_id, req.file->name);
        ctx->output_key = derive_output_key(output_prefix, ctx->object_key);
        ctx->transport = std::make_shared<s3_transport>(creds, http_client, endpoint, clock);

        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_live_locked(*ctx)) {
                return;
            }
            last_object_key = ctx->object_key;
            last_output_key = ctx->output_key;
        }

        if (!advance(*ctx, "Uploading to s3://" + ctx->source_bucket + "/" + ctx->object_key,
                     workflow_state::uploading)) {
            return;
        }
        schedule(ctx, &impl::upload);
    }

    void upload(std::shared_ptr<run_context> ctx) {
        if (!checkpoint(*ctx)) {
            return;
        }
        auto& file = *ctx->request.file;

        std::map<std::string, std::string> metadata;
        if (ctx->request.preference != transformation_preference::automatic) {
            metadata[std::string(preference_metadata_key)] =
                std::string(to_string(ctx->request.preference));
        }

        auto put = ctx->transport->put_object(ctx->source_bucket, ctx->object_key, file.bytes,
                                              file.effective_content_type(), metadata);
        if (!checkpoint(*ctx)) {
            return;
        }
        if (!put) {
            fail(*ctx, "Upload failed: " + put.error().message, put.error());
            return;
        }

        if (!advance(*ctx, msg_waiting, workflow_state::waiting)) {
            return;
        }
        schedule(ctx, &impl::poll);
    }

    void poll(std::shared_ptr<run_context> ctx) {
        if (!checkpoint(*ctx)) {
            return;
        }

        ctx->attempt += 1;
        if (!advance(*ctx, "Checking for stylized asset (attempt " +
                               std::to_string(ctx->attempt) + "/" +
                               std::to_string(config.max_poll_attempts) + ")")) {
            return;
        }
        // Observers of the entry above may have cancelled or reset the run
        if (!checkpoint(*ctx)) {
            return;
        }

        auto probe = ctx->transport->head_object(ctx->destination_bucket, ctx->output_key);
        if (!checkpoint(*ctx)) {
            return;
        }

        if (probe) {
            ctx->probe_content_type = probe.value().content_type;
            if (!advance(*ctx, msg_found, workflow_state::downloading)) {
                return;
            }
            schedule(ctx, &impl::download);
            return;
        }

        const auto& err = probe.error();
        if (err.code == error_code::object_not_found) {
            if (ctx->attempt >= config.max_poll_attempts) {
                fail(*ctx, msg_timeout, error{error_code::poll_timeout, msg_timeout, 404});
                return;
            }
            schedule(ctx, &impl::poll, config.poll_interval);
            return;
        }

        fail(*ctx, "Failed to retrieve stylized image: " + err.message, err);
    }

    void download(std::shared_ptr<run_context> ctx) {
        if (!checkpoint(*ctx)) {
            return;
        }

        auto fetched = ctx->transport->get_object(ctx->destination_bucket, ctx->output_key);
        if (!checkpoint(*ctx)) {
            return;
        }
        if (!fetched) {
            fail(*ctx, "Failed to retrieve stylized image: " + fetched.error().message,
                 fetched.error());
            return;
        }

        auto content_type = fetched.value().content_type
            .value_or(ctx->probe_content_type.value_or(config.fallback_content_type));

        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_live_locked(*ctx)) {
                return;
            }
            release_result_locked();
        }

        auto resource = materializer(make_id(), ctx->output_key,
                                     std::move(fetched.value().body), content_type);
        if (!resource) {
            fail(*ctx, "Failed to retrieve stylized image: " + resource.error().message,
                 resource.error());
            return;
        }

        pending_events events;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_live_locked(*ctx)) {
                resource.value()->release();
                return;
            }
            release_result_locked();
            current_result = std::move(resource.value());
            events.result = std::make_pair(current_result->uri(), current_result->content_type());
            append_locked(ctx.get(), msg_downloaded, log_level::info, events);
            set_state_locked(workflow_state::complete, events);
            finish_locked(*ctx);
            post_events_locked(std::move(events));
        }
        deliver_pending();
    }
};

// ============================================================================
// Builder
// ============================================================================

stylize_workflow::builder::builder() = default;

auto stylize_workflow::builder::with_config(workflow_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto stylize_workflow::builder::with_endpoint(s3_endpoint_config endpoint) -> builder& {
    endpoint_ = std::move(endpoint);
    return *this;
}

auto stylize_workflow::builder::with_scheduler(std::shared_ptr<scheduler> sched) -> builder& {
    scheduler_ = std::move(sched);
    return *this;
}

auto stylize_workflow::builder::with_http_client(
    std::shared_ptr<http_client_interface_base> client) -> builder& {
    http_client_ = std::move(client);
    return *this;
}

auto stylize_workflow::builder::with_id_generator(id_generator generator) -> builder& {
    id_generator_ = std::move(generator);
    return *this;
}

auto stylize_workflow::builder::with_clock(clock_function clock) -> builder& {
    clock_ = std::move(clock);
    return *this;
}

auto stylize_workflow::builder::with_materializer(resource_materializer materializer)
    -> builder& {
    materializer_ = std::move(materializer);
    return *this;
}

auto stylize_workflow::builder::build() -> result<stylize_workflow> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    auto state = std::make_shared<impl>();
    state->config = config_;
    state->endpoint = endpoint_;
    state->sched = scheduler_ ? scheduler_ : std::make_shared<event_loop_scheduler>();
    state->http_client = http_client_ ? http_client_
                                      : make_cloud_http_client(endpoint_.request_timeout);
    state->make_id = id_generator_ ? id_generator_ : id_generator(&cloud_utils::generate_uuid);
    state->clock = clock_ ? clock_
                          : clock_function([] { return std::chrono::system_clock::now(); });
    state->materializer = materializer_ ? materializer_ : make_memory_materializer();

    return stylize_workflow(std::move(state));
}

// ============================================================================
// stylize_workflow
// ============================================================================

stylize_workflow::stylize_workflow(std::shared_ptr<impl> state) : impl_(std::move(state)) {}

stylize_workflow::stylize_workflow(stylize_workflow&&) noexcept = default;

auto stylize_workflow::operator=(stylize_workflow&& other) noexcept -> stylize_workflow& {
    if (this != &other) {
        if (impl_) {
            impl_->shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

stylize_workflow::~stylize_workflow() {
    if (impl_) {
        impl_->shutdown();
    }
}

void stylize_workflow::start(stylize_request request) {
    impl_->start(std::move(request));
}

auto stylize_workflow::cancel() -> bool {
    return impl_->cancel();
}

void stylize_workflow::reset() {
    impl_->reset();
}

auto stylize_workflow::state() const -> workflow_state {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->current_state;
}

auto stylize_workflow::status_message() const -> std::string_view {
    return stylize::status_message(state());
}

auto stylize_workflow::is_busy() const -> bool {
    return stylize::is_busy(state());
}

auto stylize_workflow::log_entries() const -> std::vector<log_entry> {
    return impl_->log.entries();
}

auto stylize_workflow::last_error() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

auto stylize_workflow::has_result() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return static_cast<bool>(impl_->current_result);
}

auto stylize_workflow::result_uri() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->current_result) {
        return std::nullopt;
    }
    return impl_->current_result->uri();
}

auto stylize_workflow::result_content_type() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->current_result) {
        return std::nullopt;
    }
    return impl_->current_result->content_type();
}

auto stylize_workflow::result_data() const -> result<std::vector<uint8_t>> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->current_result) {
        return unexpected{error{error_code::invalid_state, "No stylized result available"}};
    }
    return impl_->current_result->data();
}

auto stylize_workflow::uploaded_key() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_object_key;
}

auto stylize_workflow::output_key() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_output_key;
}

auto stylize_workflow::config() const -> const workflow_config& {
    return impl_->config;
}

void stylize_workflow::on_state_changed(state_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->state_cb = std::move(callback);
}

void stylize_workflow::on_log_entry(log_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->log_cb = std::move(callback);
}

void stylize_workflow::on_result(result_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->result_cb = std::move(callback);
}

}  // namespace kcenon::stylize

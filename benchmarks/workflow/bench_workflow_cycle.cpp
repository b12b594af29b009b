/**
 * @file bench_workflow_cycle.cpp
 * @brief Benchmarks for complete workflow runs on virtual time
 *
 * Network and waiting are simulated, so these measure engine overhead:
 * scheduling, signing, logging and result materialization.
 */

#include <benchmark/benchmark.h>

#include <kcenon/stylize/core/logging.h>
#include <kcenon/stylize/core/scheduler.h>
#include <kcenon/stylize/workflow/stylize_workflow.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>

namespace kcenon::stylize::benchmark {

namespace {

auto make_request(std::size_t size) -> stylize_request {
    stylize_request req;
    source_file file;
    file.name = "cat.png";
    file.bytes = test_data_generator::generate_random_data(size, 1);
    req.file = std::move(file);
    req.creds = benchmark_credentials();
    req.input_bucket = "input-bucket";
    req.output_bucket = "output-bucket";
    return req;
}

}  // namespace

/**
 * @brief Benchmark a run whose result appears after N misses
 */
static void BM_Workflow_Run(::benchmark::State& state) {
    const auto misses = static_cast<uint32_t>(state.range(0));
    get_logger().set_level(log_level::error);

    auto sched = std::make_shared<virtual_time_scheduler>();
    auto http = std::make_shared<in_memory_http_client>(
        test_data_generator::generate_random_data(sizes::thumbnail, 2));

    auto engine = stylize_workflow::builder()
        .with_scheduler(sched)
        .with_http_client(http)
        .build();
    if (!engine.has_value()) {
        state.SkipWithError("Failed to build workflow");
        return;
    }
    auto& wf = engine.value();
    auto request = make_request(sizes::thumbnail);

    for (auto _ : state) {
        http->reset(misses);
        wf.start(request);
        sched->run_until_idle();
        if (wf.state() != workflow_state::complete) {
            state.SkipWithError("Workflow did not complete");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Workflow_Run)
    ->Arg(0)
    ->Arg(5)
    ->Arg(23)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::stylize::benchmark

BENCHMARK_MAIN();

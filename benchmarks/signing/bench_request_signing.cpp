/**
 * @file bench_request_signing.cpp
 * @brief Benchmarks for SigV4 signing and payload hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/stylize/cloud/cloud_utils.h>
#include <kcenon/stylize/cloud/request_signer.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace kcenon::stylize::benchmark {

// ============================================================================
// Signing Benchmarks
// ============================================================================

/**
 * @brief Benchmark signing-key derivation (four chained HMACs)
 */
static void BM_Signing_Key_Derivation(::benchmark::State& state) {
    const std::string secret = "wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY";

    for (auto _ : state) {
        auto key = request_signer::derive_signing_key(secret, "20240101", "us-east-1", "s3");
        ::benchmark::DoNotOptimize(key);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark signing a HEAD probe (empty payload)
 */
static void BM_Sign_Head_Probe(::benchmark::State& state) {
    request_signer signer(benchmark_credentials());
    request_descriptor desc;
    desc.method = http_method::head;
    desc.bucket = "output-bucket";
    desc.key = "stylized/uploads/0f8e2f8c-cat.png";
    auto when = std::chrono::system_clock::now();

    for (auto _ : state) {
        auto result = signer.sign(desc, when);
        if (!result.has_value()) {
            state.SkipWithError("Signing failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark signing an upload, including the payload hash
 */
static void BM_Sign_Upload(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    request_signer signer(benchmark_credentials());

    request_descriptor desc;
    desc.method = http_method::put;
    desc.bucket = "input-bucket";
    desc.key = "uploads/0f8e2f8c-cat.png";
    desc.headers["content-type"] = "image/png";
    desc.headers["x-amz-meta-stylize-preference"] = "cartoon";
    desc.body = test_data_generator::generate_random_data(size, 42);
    auto when = std::chrono::system_clock::now();

    for (auto _ : state) {
        auto result = signer.compute(desc, when);
        if (!result.has_value()) {
            state.SkipWithError("Signing failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value().signature);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * size));
    state.SetLabel(format_bytes(size));
}

// ============================================================================
// Hashing Benchmarks
// ============================================================================

/**
 * @brief Benchmark SHA-256 over image-sized buffers
 */
static void BM_Payload_SHA256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 7);

    for (auto _ : state) {
        auto digest = cloud_utils::sha256_hex(std::span<const uint8_t>(data));
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * size));
    state.SetLabel(format_bytes(size));
}

/**
 * @brief Benchmark object key percent-encoding
 */
static void BM_Encode_Object_Key(::benchmark::State& state) {
    const std::string key = "stylized/uploads/0f8e2f8c-my holiday photo (1).png";

    for (auto _ : state) {
        auto encoded = cloud_utils::encode_object_key(key);
        ::benchmark::DoNotOptimize(encoded);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Signing_Key_Derivation)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Sign_Head_Probe)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Sign_Upload)
    ->Arg(static_cast<int64_t>(sizes::thumbnail))
    ->Arg(static_cast<int64_t>(sizes::photo))
    ->Arg(static_cast<int64_t>(sizes::large_photo))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Payload_SHA256)
    ->Arg(static_cast<int64_t>(sizes::thumbnail))
    ->Arg(static_cast<int64_t>(sizes::photo))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Encode_Object_Key)
    ->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::stylize::benchmark

BENCHMARK_MAIN();

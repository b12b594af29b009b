/**
 * @file stylize_upload.cpp
 * @brief Upload an image and wait for its stylized copy
 *
 * This example uploads a local image to the source bucket, polls the
 * destination bucket until the stylized object appears, and writes the
 * downloaded result next to the input.
 *
 * Prerequisites:
 * - AWS credentials in the environment
 * - A source bucket whose uploads trigger the stylizing function
 *
 * Build:
 *   cmake --build build --target stylize_upload
 *
 * Run:
 *   ./build/bin/stylize_upload <image> <input-bucket> <output-bucket> [auto|cartoon|colorize]
 */

#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#include "kcenon/stylize/stylize.h"

using namespace kcenon::stylize;

namespace {

/**
 * @brief Print usage information
 */
void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <image> <input-bucket> <output-bucket> [preference]\n\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  image          Local image file to upload\n";
    std::cerr << "  input-bucket   Bucket whose uploads trigger stylizing\n";
    std::cerr << "  output-bucket  Bucket receiving stylized images\n";
    std::cerr << "  preference     auto (default), cartoon or colorize\n\n";
    std::cerr << "Environment:\n";
    std::cerr << "  AWS_REGION             AWS region (default: us-east-1)\n";
    std::cerr << "  AWS_ACCESS_KEY_ID      AWS access key\n";
    std::cerr << "  AWS_SECRET_ACCESS_KEY  AWS secret key\n";
    std::cerr << "  AWS_SESSION_TOKEN      Optional session token\n";
}

auto env_or(const char* name, const std::string& fallback) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

auto load_credentials() -> credentials {
    credentials creds;
    creds.region = env_or("AWS_REGION", "us-east-1");
    creds.access_key_id = env_or("AWS_ACCESS_KEY_ID", "");
    creds.secret_access_key = env_or("AWS_SECRET_ACCESS_KEY", "");
    auto token = env_or("AWS_SESSION_TOKEN", "");
    if (!token.empty()) {
        creds.session_token = token;
    }
    return creds;
}

auto output_path_for(const std::filesystem::path& input) -> std::filesystem::path {
    auto out = input;
    out.replace_filename(input.stem().string() + "-stylized" + input.extension().string());
    return out;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path image = argv[1];
    auto preference = parse_transformation_preference(argc > 4 ? argv[4] : "auto");
    if (!preference) {
        std::cerr << "Unknown preference: " << argv[4] << "\n";
        print_usage(argv[0]);
        return 1;
    }

    auto file = source_file::from_path(image);
    if (!file.has_value()) {
        std::cerr << file.error().message << "\n";
        return 1;
    }

    std::cout << "=== Stylize Upload ===\n\n";
    std::cout << "Version: " << version::to_string() << "\n";
    std::cout << "Image: " << image << " (" << file.value().bytes.size() << " bytes)\n\n";

    auto engine = stylize_workflow::builder().build();
    if (!engine.has_value()) {
        std::cerr << "Failed to create workflow: " << engine.error().message << "\n";
        return 1;
    }
    auto& workflow = engine.value();

    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;

    workflow.on_log_entry([](const log_entry& entry) {
        std::cout << "[" << entry.timestamp << "] " << entry.message << "\n";
    });
    workflow.on_state_changed([&](workflow_state state) {
        if (state == workflow_state::complete || state == workflow_state::error ||
            state == workflow_state::idle) {
            std::lock_guard<std::mutex> lock(mutex);
            finished = true;
            cv.notify_all();
        }
    });

    stylize_request request;
    request.file = std::move(file.value());
    request.creds = load_credentials();
    request.input_bucket = argv[2];
    request.output_bucket = argv[3];
    request.preference = *preference;
    workflow.start(std::move(request));

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return finished; });
    }

    std::cout << "\nStatus: " << workflow.status_message() << "\n";
    if (workflow.state() != workflow_state::complete) {
        if (auto err = workflow.last_error()) {
            std::cerr << "Error: " << err->message << "\n";
        }
        return 1;
    }

    auto data = workflow.result_data();
    if (!data.has_value()) {
        std::cerr << "Failed to read result: " << data.error().message << "\n";
        return 1;
    }

    auto out_path = output_path_for(image);
    std::ofstream out(out_path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.value().data()),
              static_cast<std::streamsize>(data.value().size()));
    if (!out) {
        std::cerr << "Failed to write " << out_path << "\n";
        return 1;
    }

    std::cout << "Saved " << data.value().size() << " bytes ("
              << workflow.result_content_type().value_or("unknown") << ") to "
              << out_path << "\n";
    return 0;
}

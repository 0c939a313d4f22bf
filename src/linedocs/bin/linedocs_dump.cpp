#include <linedocs/common/constants.h>
#include <linedocs/config.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/line_docs/line_file_docs.h>
#include <linedocs/line_docs/options.h>
#include <linedocs/utils/filesystem.h>
#include <linedocs/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {
std::string format_record(const linedocs::Document &doc) {
    std::string out = doc.get("docid");
    out += '\t';
    out += doc.get("titleTokenized");
    out += '\t';
    out += doc.get("date");
    out += '\t';
    out += doc.get("body");
    out += '\n';
    return out;
}
}  // namespace

int main(int argc, char **argv) {
    const char *env_log_level =
        std::getenv(linedocs::constants::environment::LOG_LEVEL);

    argparse::ArgumentParser program("linedocs_dump", LINEDOCS_PACKAGE_VERSION);
    program.add_description(
        "Print records of a line docs corpus starting at a seeded random "
        "position");
    program.add_argument("file")
        .help("Corpus file or bundled identifier (default: LINEDOCS_FILE)")
        .default_value<std::string>("");
    program.add_argument("-s", "--seed")
        .help("Seed for the start position, negative reads from the start")
        .default_value<int64_t>(-1)
        .scan<'d', int64_t>();
    program.add_argument("-n", "--count")
        .help("Number of records to print")
        .default_value<size_t>(10)
        .scan<'d', size_t>();
    program.add_argument("-t", "--threads")
        .help("Number of reader threads")
        .default_value<size_t>(1)
        .scan<'d', size_t>();
    program.add_argument("--no-doc-values")
        .help("Do not populate the titleDV projection")
        .flag();
    program.add_argument("--reset-every")
        .help("Reset with the same seed after every N records (0 disables)")
        .default_value<size_t>(0)
        .scan<'d', size_t>();
    program.add_argument("--materialize")
        .help("Decompress a gzip corpus once before reading")
        .flag();
    program.add_argument("--log-level")
        .help(
            "Set logging level (trace, debug, info, warn, error, critical, "
            "off); defaults to LINEDOCS_LOG_LEVEL, else info")
        .default_value<std::string>(env_log_level ? env_log_level : "info");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception &err) {
        spdlog::error("Error occurred: {}", err.what());
        std::cerr << program;
        return 1;
    }

    std::string path = program.get<std::string>("file");
    int64_t seed_arg = program.get<int64_t>("--seed");
    size_t count = program.get<size_t>("--count");
    size_t num_threads = program.get<size_t>("--threads");
    bool use_doc_values = !program.get<bool>("--no-doc-values");
    size_t reset_every = program.get<size_t>("--reset-every");
    bool materialize = program.get<bool>("--materialize");
    std::string log_level_str = program.get<std::string>("--log-level");

    // stderr-based logger to ensure logs don't interfere with data output
    auto logger = spdlog::stderr_color_mt("stderr");
    spdlog::set_default_logger(logger);
    linedocs::logger::init_from_environment();
    if (program.is_used("--log-level") || !env_log_level) {
        linedocs::logger::set_log_level(log_level_str);
    }

    if (num_threads == 0) {
        spdlog::error("Thread count must be positive");
        return 1;
    }

    linedocs::LineFileDocsOptions options =
        linedocs::LineFileDocsOptions::from_environment();
    if (!path.empty()) {
        options.path = path;
    }
    if (seed_arg >= 0) {
        options.seed = static_cast<std::uint64_t>(seed_arg);
    }
    options.use_doc_values = use_doc_values;

    spdlog::debug("Processing corpus: {}", options.path);
    spdlog::debug("Seed: {}", seed_arg);
    spdlog::debug("Records: {}, threads: {}", count, num_threads);

    std::string materialized;
    int status = 0;
    try {
        if (materialize) {
            materialized = linedocs::maybe_create_temp_file(options);
            if (!materialized.empty()) {
                spdlog::info("Decompressed {} to {}", options.path,
                             materialized);
                options.path = materialized;
            }
        }

        linedocs::LineFileDocs docs(options);
        std::atomic<size_t> next(0);
        std::atomic<bool> failed(false);
        std::mutex output_mutex;

        auto worker = [&]() {
            while (!failed.load()) {
                size_t index = next.fetch_add(1);
                if (index >= count) {
                    break;
                }
                try {
                    if (reset_every > 0 && index > 0 &&
                        index % reset_every == 0) {
                        docs.reset(options.seed);
                    }
                    std::string out = format_record(docs.next_doc());
                    std::lock_guard<std::mutex> lock(output_mutex);
                    std::fwrite(out.data(), 1, out.size(), stdout);
                } catch (const linedocs::LineDocsError &e) {
                    spdlog::error("Reader error: {}", e.what());
                    failed.store(true);
                }
            }
        };

        std::vector<std::thread> threads;
        for (size_t i = 1; i < num_threads; ++i) {
            threads.emplace_back(worker);
        }
        worker();
        for (auto &thread : threads) {
            thread.join();
        }
        std::fflush(stdout);
        status = failed.load() ? 1 : 0;
    } catch (const linedocs::LineDocsError &e) {
        spdlog::error("Reader error: {}", e.what());
        status = 1;
    }

    if (!materialized.empty()) {
        std::error_code ec;
        fs::remove(materialized, ec);
        if (ec) {
            spdlog::warn("Failed to remove {}: {}", materialized, ec.message());
        }
    }
    return status;
}

#include "bench/throughput.hpp"
#include "config/config.hpp"
#include "generator/snowflake.hpp"
#include "generator/snowflake_exception.hpp"
#include "logger/spdlog_init.hpp"
#include "utils/string.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <unistd.h>

using namespace std;
using namespace snowgen;

static void print_help()
{
    cout << "\nsnowgen\n\n"
            "Options:\n"
            "  -h            This message\n"
            "  -c <file>     Path to configuration file\n"
            "  -n <count>    Generate count ids (default 1)\n"
            "  -d <id>       Decode an id\n"
            "  -b <samples>  Measure generation throughput over one-second samples\n"
         << endl;
}


static void decode_id(const snowflake &gen, const string &text)
{
    const auto id = config::fromString<uint64_t>(text);
    const auto decoded = gen.decode(id);

    cout << fmt::format("id:        {}\n"
                        "timestamp: {}\n"
                        "node_id:   {}\n"
                        "sequence:  {}\n",
                        id, decoded.timestamp, decoded.node_id, decoded.sequence);
}


static void run_benchmark(int64_t epoch, size_t samples)
{
    using utils::string::group_thousands;

    cout << fmt::format("collecting {} samples...\n", samples);
    const auto counts = bench::run(epoch, samples, std::chrono::milliseconds(1000), [](size_t done, size_t total) {
        cout << fmt::format("\rprogress: {}/{}", done, total) << flush;
    });
    cout << "\n\n";

    const auto stats = bench::summarize(counts);
    cout << "=== throughput statistics ===\n"
         << fmt::format("samples: {}\n\n", stats.samples)
         << fmt::format("average: {} ids/second\n", group_thousands(static_cast<uint64_t>(stats.average + 0.5)))
         << fmt::format("median:  {} ids/second\n", group_thousands(stats.median))
         << fmt::format("min:     {} ids/second\n", group_thousands(stats.min))
         << fmt::format("max:     {} ids/second\n\n", group_thousands(stats.max))
         << fmt::format("p95:     {} ids/second\n", group_thousands(stats.p95))
         << fmt::format("p99:     {} ids/second\n\n", group_thousands(stats.p99))
         << fmt::format("std dev: {} ids/second\n", group_thousands(static_cast<uint64_t>(stats.std_dev + 0.5)))
         << fmt::format("variance: {}\n", group_thousands(static_cast<uint64_t>(stats.variance + 0.5)));
}


int main(int argc, char *argv[])
{
    int ch = 0;
    const char *config_file = nullptr;
    const char *decode_arg = nullptr;
    const char *count_arg = nullptr;
    const char *bench_arg = nullptr;

    while ((ch = getopt(argc, argv, "hc:n:d:b:")) != -1) {
        switch (ch) {
        case 'c':
            config_file = optarg;
            break;
        case 'n':
            count_arg = optarg;
            break;
        case 'd':
            decode_arg = optarg;
            break;
        case 'b':
            bench_arg = optarg;
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    try {
        config::Config cfg;
        if (config_file != nullptr)
            cfg = config::load(config_file);
        logging::init_spdlog(cfg.general);

        if (bench_arg != nullptr) {
            run_benchmark(cfg.generator.epoch, config::fromString<size_t>(bench_arg));
            return EXIT_SUCCESS;
        }

        snowflake gen(cfg.generator.epoch, cfg.generator.node_id);
        spdlog::debug("snowgen node id {}, epoch {}", gen.node_id(), gen.epoch());

        if (decode_arg != nullptr) {
            decode_id(gen, decode_arg);
            return EXIT_SUCCESS;
        }

        const auto count = count_arg != nullptr ? config::fromString<uint64_t>(count_arg) : 1;
        for (uint64_t i = 0; i < count; ++i)
            cout << gen.generate() << '\n';
        cout << flush;

        return EXIT_SUCCESS;
    } catch (const configuration_error &e) {
        spdlog::error("Configuration error: {}", e.what());
    } catch (const clock_regression_error &e) {
        spdlog::error("Clock regression: {}", e.what());
    } catch (const exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    }

    return EXIT_FAILURE;
}

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace snowgen {
class snowflake;
}

namespace snowgen::bench {

struct throughput_stats {
    std::size_t samples = 0;
    double average = 0;
    std::uint64_t median = 0;
    std::uint64_t min = 0;
    std::uint64_t max = 0;
    std::uint64_t p95 = 0;
    std::uint64_t p99 = 0;
    double std_dev = 0; // population
    double variance = 0;
};

// Throws std::invalid_argument for an empty sample set
throughput_stats summarize(std::vector<std::uint64_t> samples);

// Number of ids gen produced during window
std::uint64_t measure(snowflake &gen, std::chrono::milliseconds window);

// One fresh generator (node id 1) per sample; progress is called after each
std::vector<std::uint64_t> run(std::int64_t epoch, std::size_t samples, std::chrono::milliseconds window,
                               const std::function<void(std::size_t done, std::size_t total)> &progress = {});

} // namespace snowgen::bench

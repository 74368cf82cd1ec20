#include "throughput.hpp"
#include "generator/snowflake.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace snowgen::bench {

throughput_stats summarize(std::vector<std::uint64_t> samples)
{
    if (samples.empty())
        throw std::invalid_argument("Cannot summarize an empty sample set");

    std::sort(samples.begin(), samples.end());

    const auto n = samples.size();
    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);

    throughput_stats stats;
    stats.samples = n;
    stats.average = sum / static_cast<double>(n);
    stats.min = samples.front();
    stats.max = samples.back();
    stats.median = samples[n / 2];
    stats.p95 = samples[static_cast<std::size_t>(static_cast<double>(n) * 0.95)];
    stats.p99 = samples[static_cast<std::size_t>(static_cast<double>(n) * 0.99)];

    double squares = 0;
    for (auto sample: samples) {
        const double d = static_cast<double>(sample) - stats.average;
        squares += d * d;
    }
    stats.variance = squares / static_cast<double>(n);
    stats.std_dev = std::sqrt(stats.variance);

    return stats;
}


std::uint64_t measure(snowflake &gen, std::chrono::milliseconds window)
{
    using clock = std::chrono::steady_clock;
    const auto end = clock::now() + window;

    std::uint64_t count = 0;
    while (clock::now() < end) {
        gen.generate();
        ++count;
    }
    return count;
}


std::vector<std::uint64_t> run(std::int64_t epoch, std::size_t samples, std::chrono::milliseconds window,
                               const std::function<void(std::size_t, std::size_t)> &progress)
{
    std::vector<std::uint64_t> result;
    result.reserve(samples);

    for (std::size_t i = 0; i < samples; ++i) {
        snowflake gen(epoch, 1);
        result.push_back(measure(gen, window));
        if (progress)
            progress(i + 1, samples);
    }
    return result;
}

} // namespace snowgen::bench

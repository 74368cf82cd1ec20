#pragma once
#include <cstdint>

namespace snowgen {

// Wall clock reading in milliseconds since the Unix epoch
class clock_source {
public:
    virtual ~clock_source() = default;
    virtual std::int64_t now_ms() = 0;
};


class system_clock_source : public clock_source {
public:
    std::int64_t now_ms() override;
};

} // namespace snowgen

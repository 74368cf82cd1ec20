#pragma once
#include <stdexcept>

namespace snowgen {

class snowflake_exception : public std::runtime_error {
public:
    explicit snowflake_exception(const std::string &desc)
        : runtime_error{desc}
    { }
};


// Invalid construction parameters; no generator is produced
class configuration_error : public snowflake_exception {
public:
    explicit configuration_error(const std::string &desc)
        : snowflake_exception{desc}
    { }
};


// The wall clock went backwards relative to the last issued id
class clock_regression_error : public snowflake_exception {
public:
    explicit clock_regression_error(const std::string &desc)
        : snowflake_exception{desc}
    { }
};


class timestamp_overflow_error : public snowflake_exception {
public:
    explicit timestamp_overflow_error(const std::string &desc)
        : snowflake_exception{desc}
    { }
};

} // namespace snowgen

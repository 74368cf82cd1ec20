#include "string.hpp"
#include <string>
#include <system_error>

namespace snowgen::utils::string {

std::string str_err(int errnum)
{
    return std::system_category().message(errnum);
}


std::string group_thousands(std::uint64_t value)
{
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0)
            result += ',';
        result += digits[i];
    }
    return result;
}

} // namespace snowgen::utils::string

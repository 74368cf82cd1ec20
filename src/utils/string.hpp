#pragma once
#include <cstdint>
#include <string>

namespace snowgen::utils::string {

std::string str_err(int errnum);

// 1234567 -> "1,234,567", independent of the global locale
std::string group_thousands(std::uint64_t value);

} // namespace snowgen::utils::string

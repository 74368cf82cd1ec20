#pragma once

namespace snowgen::config {
struct GeneralSection;
}

namespace snowgen::logging {

// Select the default spdlog logger and level from the [general] section.
// Throws std::runtime_error for an unknown log_priority or log_facility.
void init_spdlog(const config::GeneralSection &general_section);

} // namespace snowgen::logging

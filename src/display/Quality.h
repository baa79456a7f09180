#pragma once

#include <cstdint>
#include <string>

namespace display {

enum class Quality : uint8_t { Good = 0, CheckRange, Unknown, Invalid };

const char *qualityName(Quality q);

// "S*" in [0, 50] m/s and "T*" in [-40, 60] degC are Good.
Quality assessQuality(const std::string &name, const std::string &raw_value);

// m/s, degC, or "" for other parameters
const char *unitFor(const std::string &name);

} // namespace display

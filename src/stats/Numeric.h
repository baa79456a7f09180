#pragma once

#include <string>

namespace stats {

// Whole-token float parse; surrounding whitespace allowed. NaN and
// infinities are rejected.
bool parseNumber(const std::string &s, double &out);

} // namespace stats

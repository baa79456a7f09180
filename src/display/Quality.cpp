#include "display/Quality.h"

#include "config/Config.h"
#include "stats/Numeric.h"

namespace display {

const char *qualityName(Quality q) {
	switch (q) {
	case Quality::Good:
		return "Good";
	case Quality::CheckRange:
		return "Check Range";
	case Quality::Unknown:
		return "Unknown";
	case Quality::Invalid:
		return "Invalid";
	}
	return "?";
}

Quality assessQuality(const std::string &name, const std::string &raw_value) {
	double v = 0.0;
	if (!stats::parseNumber(raw_value, v))
		return Quality::Invalid;
	if (name.empty())
		return Quality::Unknown;
	if (name[0] == 'S')
		return (v >= cfg::SPEED_GOOD_MIN && v <= cfg::SPEED_GOOD_MAX)
				   ? Quality::Good
				   : Quality::CheckRange;
	if (name[0] == 'T')
		return (v >= cfg::TEMP_GOOD_MIN && v <= cfg::TEMP_GOOD_MAX)
				   ? Quality::Good
				   : Quality::CheckRange;
	return Quality::Unknown;
}

const char *unitFor(const std::string &name) {
	if (name.empty())
		return "";
	if (name[0] == 'S')
		return "m/s";
	if (name[0] == 'T')
		return "degC";
	return "";
}

} // namespace display

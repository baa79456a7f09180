#include "stats/Numeric.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace stats {

bool parseNumber(const std::string &s, double &out) {
	const char *begin = s.c_str();
	while (*begin && std::isspace((unsigned char)*begin))
		++begin;
	if (*begin == '\0')
		return false;
	// decimal only, no hex floats
	const char *digits = (*begin == '+' || *begin == '-') ? begin + 1 : begin;
	if (digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
		return false;

	char *end = nullptr;
	const double v = std::strtod(begin, &end);
	if (end == begin)
		return false;
	while (*end && std::isspace((unsigned char)*end))
		++end;
	if (*end != '\0')
		return false;
	if (!std::isfinite(v))
		return false;
	out = v;
	return true;
}

} // namespace stats

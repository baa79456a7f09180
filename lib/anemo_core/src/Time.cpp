#include <anemo/core/Time.hpp>

#include <cstdio>
#include <time.h>

namespace anemo::core {

uint64_t Time::us() {
	timespec ts{};
	clock_gettime(CLOCK_MONOTONIC, &ts);
	return (uint64_t)ts.tv_sec * 1000000ULL + (uint64_t)ts.tv_nsec / 1000ULL;
}

uint64_t Time::wallUs() {
	timespec ts{};
	clock_gettime(CLOCK_REALTIME, &ts);
	return (uint64_t)ts.tv_sec * 1000000ULL + (uint64_t)ts.tv_nsec / 1000ULL;
}

static tm toLocal(uint64_t wall_us) {
	const time_t secs = (time_t)(wall_us / 1000000ULL);
	tm out{};
	localtime_r(&secs, &out);
	return out;
}

std::string Time::formatIso(uint64_t wall_us) {
	const tm t = toLocal(wall_us);
	char buf[40];
	std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06u",
				  t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour,
				  t.tm_min, t.tm_sec, (unsigned)(wall_us % 1000000ULL));
	return buf;
}

std::string Time::fileStamp(uint64_t wall_us) {
	const tm t = toLocal(wall_us);
	char buf[32];
	std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d_%02d%02d%02d",
				  t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour,
				  t.tm_min, t.tm_sec);
	return buf;
}

std::string Time::formatDuration(uint64_t elapsed_us) {
	const uint64_t total = elapsed_us / 1000000ULL;
	char buf[32];
	std::snprintf(buf, sizeof(buf), "%llu:%02u:%02u",
				  (unsigned long long)(total / 3600ULL),
				  (unsigned)((total / 60ULL) % 60ULL),
				  (unsigned)(total % 60ULL));
	return buf;
}

} // namespace anemo::core

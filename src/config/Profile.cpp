#include "config/Profile.h"

namespace cfg {

// clang-format off
static const ProfileParams kProfiles[] = {
	//  name       K    N     M    pts  ms      refresh
	{ "linux",   150, 1500,  75, 200,      0,   50 },
	{ "mac",     100, 1000,  50, 100,      0,   50 },
	{ "pi",      100,  100,  50,   0, 600000, 1000 },
	{ "windows", 200, 2000, 100, 250,      0,   30 },
};
// clang-format on

const ProfileParams &profileParams(Profile p) {
	const size_t idx = (size_t)p;
	if (idx >= sizeof(kProfiles) / sizeof(kProfiles[0]))
		return kProfiles[0];
	return kProfiles[idx];
}

const char *profileName(Profile p) { return profileParams(p).name; }

bool parseProfile(const std::string &s, Profile &out) {
	for (size_t i = 0; i < sizeof(kProfiles) / sizeof(kProfiles[0]); ++i) {
		if (s == kProfiles[i].name) {
			out = (Profile)i;
			return true;
		}
	}
	return false;
}

SessionParams applyProfile(const SessionParams &base, Profile p) {
	const ProfileParams &pp = profileParams(p);
	SessionParams out = base;
	out.stats_window = pp.stats_window;
	out.record_capacity = pp.record_capacity;
	out.series_capacity = pp.series_capacity;
	out.checkpoint_every_points = pp.checkpoint_every_points;
	out.checkpoint_interval_ms = pp.checkpoint_interval_ms;
	out.display_refresh_ms = pp.display_refresh_ms;
	return out;
}

} // namespace cfg

#pragma once

#include "config/Params.h"

#include <cstdint>
#include <string>

namespace cfg {

// Tunings of the desktop and embedded hosts the logger is deployed on.
enum class Profile : uint8_t {
	Linux = 0, // default
	Mac = 1,
	Pi = 2,
	Windows = 3,
};

struct ProfileParams {
	const char *name;

	size_t stats_window;
	size_t record_capacity;
	size_t series_capacity;

	uint32_t checkpoint_every_points;
	uint32_t checkpoint_interval_ms;

	uint32_t display_refresh_ms;
};

const ProfileParams &profileParams(Profile p);
bool parseProfile(const std::string &s, Profile &out);
const char *profileName(Profile p);

// SessionParams with the profile's tunings applied; other fields untouched.
SessionParams applyProfile(const SessionParams &base, Profile p);

} // namespace cfg

#pragma once

#include "config/Config.h"

#include <cstddef>
#include <cstdint>

namespace cfg {

struct SessionParams {
	size_t stats_window = STATS_WINDOW_DEFAULT;
	size_t record_capacity = 1500;
	size_t series_capacity = 75;

	// 0 disables the respective trigger
	uint32_t checkpoint_every_points = 200;
	uint32_t checkpoint_interval_ms = 0;

	uint32_t display_refresh_ms = 50;
	int read_timeout_ms = READ_TIMEOUT_MS;

	bool strict_header = false;
	bool save_statistics = true;
	bool show_raw = false;
};

} // namespace cfg

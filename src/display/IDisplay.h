#pragma once

#include "ingest/Record.h"
#include "stats/SampleBuffer.h"
#include "stats/StatisticsEngine.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace display {

// Read-only copy of the session handed to a display on every tick.
struct DisplaySnapshot {
	uint64_t points{};
	uint64_t runtime_us{};
	double rate_hz{};
	std::string data_file;
	std::string stats_file;
	bool show_raw = false;

	std::vector< stats::ParameterSummary > stats;
	std::vector< ingest::Record > recent;
	std::array< std::vector< double >, stats::CATEGORY_COUNT > series;
};

class IDisplay {
public:
	virtual ~IDisplay() = default;
	virtual void render(const DisplaySnapshot &snap) = 0;
	virtual void finish() {}
};

} // namespace display

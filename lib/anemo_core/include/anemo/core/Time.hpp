#pragma once
#include <cstdint>
#include <string>

namespace anemo::core {

struct Time {
	// monotonic clock
	static uint64_t us();

	// wall clock, microseconds since the Unix epoch
	static uint64_t wallUs();

	/** Local time as YYYY-MM-DDTHH:MM:SS.ffffff. Lexically sortable. */
	static std::string formatIso(uint64_t wall_us);
	/** Local time as YYYY-MM-DD_HHMMSS, for file names. */
	static std::string fileStamp(uint64_t wall_us);
	/** H:MM:SS, as used in session summaries. */
	static std::string formatDuration(uint64_t elapsed_us);
};

} // namespace anemo::core

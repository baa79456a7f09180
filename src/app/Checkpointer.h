#pragma once

#include "app/SessionContext.h"
#include "io/StatsLog.h"
#include "stats/StatisticsEngine.h"

#include <anemo/core/Result.hpp>

#include <cstdint>

namespace app {

/** Appends statistics snapshots to the statistics log every N points and/or
 * every T milliseconds, and once more at shutdown. With no log attached
 * (statistics saving disabled) every call succeeds without output. */
class Checkpointer {
public:
	Checkpointer(const stats::StatisticsEngine &engine, io::StatsLog *log,
				 uint32_t every_points, uint32_t interval_ms,
				 const IClock &clock);

	anemo::Result maybeCheckpoint(uint64_t points);
	anemo::Result flush();
	void close();

	uint32_t flushes() const { return flushes_; }

private:
	const stats::StatisticsEngine &engine_;
	io::StatsLog *log_;
	uint32_t every_points_;
	uint32_t interval_ms_;
	const IClock &clock_;
	uint64_t last_flush_us_;
	uint64_t last_points_ = 0;
	uint32_t flushes_ = 0;
};

} // namespace app

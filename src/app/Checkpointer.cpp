#include "app/Checkpointer.h"

#include <anemo/core/Log.hpp>

namespace app {

Checkpointer::Checkpointer(const stats::StatisticsEngine &engine,
						   io::StatsLog *log, uint32_t every_points,
						   uint32_t interval_ms, const IClock &clock)
	: engine_(engine), log_(log), every_points_(every_points),
	  interval_ms_(interval_ms), clock_(clock),
	  last_flush_us_(clock.monoUs()) {}

anemo::Result Checkpointer::maybeCheckpoint(uint64_t points) {
	bool due = false;
	if (every_points_ > 0 && points != last_points_ && points > 0 &&
		points % every_points_ == 0)
		due = true;
	last_points_ = points;

	if (interval_ms_ > 0 &&
		clock_.monoUs() - last_flush_us_ >= (uint64_t)interval_ms_ * 1000ULL)
		due = true;

	if (!due)
		return anemo::Result::Ok();
	return flush();
}

anemo::Result Checkpointer::flush() {
	last_flush_us_ = clock_.monoUs();
	if (!log_)
		return anemo::Result::Ok();
	const auto rows = engine_.snapshot();
	if (rows.empty())
		return anemo::Result::Ok();

	anemo::Result res = log_->append(clock_.wallUs(), rows);
	if (!res.ok())
		return res;
	++flushes_;
	ANEMO_LOGD("checkpoint", "flushed parameters=" +
								 std::to_string(rows.size()) +
								 " total_rows=" +
								 std::to_string(log_->rowsWritten()));
	return res;
}

void Checkpointer::close() {
	if (log_)
		log_->close();
}

} // namespace app

#include "display/DisplayRunner.h"

#include "config/Config.h"

#include <chrono>
#include <utility>

namespace display {

DisplayRunner::DisplayRunner(IDisplay &display,
							 const stats::StatisticsEngine &engine,
							 const stats::SampleBuffer &buffer,
							 const app::IngestionLoop &loop,
							 const app::IClock &clock)
	: display_(display), engine_(engine), buffer_(buffer), loop_state_(loop),
	  clock_(clock) {}

DisplayRunner::~DisplayRunner() { stop(); }

void DisplayRunner::setFiles(std::string data_file, std::string stats_file) {
	data_file_ = std::move(data_file);
	stats_file_ = std::move(stats_file);
}

DisplaySnapshot DisplayRunner::snapshot() const {
	DisplaySnapshot s;
	s.points = loop_state_.points();
	s.rate_hz = loop_state_.rateHz();
	const uint64_t now = clock_.monoUs();
	const uint64_t started = loop_state_.startedUs();
	s.runtime_us = (now > started) ? now - started : 0;
	s.data_file = data_file_;
	s.stats_file = stats_file_;
	s.show_raw = show_raw_;
	s.stats = engine_.snapshot();
	s.recent = buffer_.recent(cfg::RAW_LINES_SHOWN);
	for (size_t c = 0; c < stats::CATEGORY_COUNT; ++c)
		s.series[c] = buffer_.series((stats::Category)c);
	return s;
}

void DisplayRunner::start(uint32_t refresh_ms) {
	if (running_.exchange(true))
		return;
	refresh_ms_ = refresh_ms == 0 ? 1 : refresh_ms;
	th_ = std::thread([this] { loop_(); });
}

void DisplayRunner::stop() {
	if (!running_.exchange(false))
		return;
	cv_.notify_all();
	if (th_.joinable())
		th_.join();
	display_.render(snapshot());
	display_.finish();
}

void DisplayRunner::loop_() {
	while (running_.load()) {
		display_.render(snapshot());
		std::unique_lock< std::mutex > lk(mtx_);
		cv_.wait_for(lk, std::chrono::milliseconds(refresh_ms_),
					 [&] { return !running_.load(); });
	}
}

} // namespace display

#pragma once

#include "app/IngestionLoop.h"
#include "display/IDisplay.h"
#include "stats/SampleBuffer.h"
#include "stats/StatisticsEngine.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace display {

/** Renders on its own thread every refresh_ms. Only reads copies from the
 * statistics engine, the sample buffer and the loop counters. */
class DisplayRunner {
public:
	DisplayRunner(IDisplay &display, const stats::StatisticsEngine &engine,
				  const stats::SampleBuffer &buffer,
				  const app::IngestionLoop &loop, const app::IClock &clock);
	~DisplayRunner();

	void setFiles(std::string data_file, std::string stats_file);
	void setShowRaw(bool show) { show_raw_ = show; }

	void start(uint32_t refresh_ms);
	void stop();

	DisplaySnapshot snapshot() const;

private:
	void loop_();

	IDisplay &display_;
	const stats::StatisticsEngine &engine_;
	const stats::SampleBuffer &buffer_;
	const app::IngestionLoop &loop_state_;
	const app::IClock &clock_;
	std::string data_file_;
	std::string stats_file_;
	bool show_raw_ = false;
	uint32_t refresh_ms_ = 50;

	std::atomic< bool > running_{false};
	std::mutex mtx_;
	std::condition_variable cv_;
	std::thread th_;
};

} // namespace display

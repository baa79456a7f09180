#pragma once

#include "app/Checkpointer.h"
#include "app/SessionContext.h"
#include "ingest/LineParser.h"
#include "ingest/SchemaRegistry.h"
#include "io/RecordWriter.h"
#include "stats/SampleBuffer.h"
#include "stats/StatisticsEngine.h"
#include "transport/ILineTransport.h"

#include <anemo/core/Result.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace app {

enum class LoopState : uint8_t { Idle = 0, Connected, Streaming, Draining, Closed };

const char *loopStateName(LoopState s);

// Components the loop drives, in call order. Not owned.
struct Pipeline {
	ingest::SchemaRegistry &schema;
	io::RecordWriter &writer;
	stats::StatisticsEngine &stats;
	stats::SampleBuffer &buffer;
	Checkpointer &checkpointer;
};

struct SessionSummary {
	uint64_t points{};
	uint64_t runtime_us{};
	double average_rate_hz{};
	size_t parameters{};
};

/** Idle -> Connected -> Streaming -> Draining -> Closed.
 *
 * Each Streaming cycle checks the stop request, reads at most one line and
 * pushes it through parser, schema, writer, statistics and buffer. A
 * transport or file error moves straight to Draining, where the final
 * checkpoint is written; Closed releases the transport and the files. */
class IngestionLoop {
public:
	IngestionLoop(SessionContext &ctx, transport::ILineTransport &transport,
				  Pipeline pipeline);

	// The transport has been acquired by the caller.
	void connect();
	LoopState step();
	LoopState run();

	LoopState state() const { return state_; }
	uint64_t points() const { return points_.load(); }
	double rateHz() const { return rate_hz_.load(); }
	uint64_t startedUs() const { return started_mono_us_; }
	const anemo::Result &lastError() const { return last_error_; }
	SessionSummary summary() const;

private:
	void stream_();
	bool ingest_(const std::string &line);
	void drain_();
	void close_();
	void fail_(const anemo::Result &res, const char *what);
	void dumpStats_();
	void setState_(LoopState s);

	SessionContext &ctx_;
	transport::ILineTransport &transport_;
	Pipeline p_;
	ingest::LineParser parser_;

	LoopState state_ = LoopState::Idle;
	anemo::Result last_error_;
	std::atomic< uint64_t > points_{0};
	std::atomic< double > rate_hz_{0.0};
	bool started_ = false;
	uint64_t started_mono_us_ = 0;
	uint64_t closed_mono_us_ = 0;
	uint64_t last_record_mono_us_ = 0;
};

} // namespace app

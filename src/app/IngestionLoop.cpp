#include "app/IngestionLoop.h"

#include <anemo/core/Log.hpp>
#include <anemo/core/Time.hpp>

#include <cstdio>

namespace app {

using anemo::Errc;
using anemo::Result;

const char *loopStateName(LoopState s) {
	switch (s) {
	case LoopState::Idle:
		return "IDLE";
	case LoopState::Connected:
		return "CONNECTED";
	case LoopState::Streaming:
		return "STREAMING";
	case LoopState::Draining:
		return "DRAINING";
	case LoopState::Closed:
		return "CLOSED";
	}
	return "UNKNOWN";
}

IngestionLoop::IngestionLoop(SessionContext &ctx,
							 transport::ILineTransport &transport,
							 Pipeline pipeline)
	: ctx_(ctx), transport_(transport), p_(pipeline) {}

void IngestionLoop::setState_(LoopState s) {
	if (s == state_)
		return;
	ANEMO_LOGD("loop", std::string(loopStateName(state_)) + " -> " +
						   loopStateName(s));
	state_ = s;
}

void IngestionLoop::connect() {
	if (state_ != LoopState::Idle)
		return;
	started_mono_us_ = ctx_.clock.monoUs();
	started_ = true;
	ANEMO_LOGI("loop", "connected to " + transport_.describe());
	setState_(LoopState::Connected);
}

LoopState IngestionLoop::step() {
	switch (state_) {
	case LoopState::Idle:
		break;
	case LoopState::Connected:
		setState_(LoopState::Streaming);
		break;
	case LoopState::Streaming:
		stream_();
		break;
	case LoopState::Draining:
		drain_();
		break;
	case LoopState::Closed:
		break;
	}
	return state_;
}

LoopState IngestionLoop::run() {
	if (state_ == LoopState::Idle) {
		ANEMO_LOGE("loop", "run() without a connected transport");
		return state_;
	}
	while (state_ != LoopState::Closed)
		step();
	return state_;
}

void IngestionLoop::fail_(const Result &res, const char *what) {
	last_error_ = res;
	ANEMO_LOGE("loop", std::string(what) + " failed (" +
						   anemo::errcName(res.code) + "): " + res.msg);
	setState_(LoopState::Draining);
}

void IngestionLoop::stream_() {
	if (ctx_.stop.raised()) {
		ANEMO_LOGI("loop", "stop requested after " +
							   std::to_string(points_.load()) + " points");
		setState_(LoopState::Draining);
		return;
	}
	if (ctx_.dump_stats.raised()) {
		ctx_.dump_stats.clear();
		dumpStats_();
	}

	std::string line;
	Result res = transport_.readLine(ctx_.params.read_timeout_ms, line);
	if (res.code == Errc::Closed) {
		last_error_ = res;
		ANEMO_LOGI("loop", "transport closed: " + res.msg);
		setState_(LoopState::Draining);
		return;
	}
	if (!res.ok() && res.code != Errc::Timeout) {
		fail_(res, "transport read");
		return;
	}

	line = ingest::trim(line);
	if (!line.empty() && !ingest_(line))
		return;

	Result cp = p_.checkpointer.maybeCheckpoint(points_.load());
	if (!cp.ok())
		fail_(cp, "checkpoint");
}

bool IngestionLoop::ingest_(const std::string &line) {
	ingest::Record r;
	r.ts_us = ctx_.clock.wallUs();
	r.raw_line = line;
	r.fields = parser_.parse(line);

	if (p_.schema.observe(r.fields))
		ANEMO_LOGD("loop", "schema grew to " +
							   std::to_string(p_.schema.size()) + " columns");

	Result res = p_.writer.write(r);
	if (!res.ok()) {
		fail_(res, "data log write");
		return false;
	}

	for (const auto &f : r.fields)
		p_.stats.update(f.first, f.second);
	p_.buffer.push(r);

	const uint64_t now_us = ctx_.clock.monoUs();
	if (points_.load() > 0 && now_us > last_record_mono_us_)
		rate_hz_.store(1e6 / (double)(now_us - last_record_mono_us_));
	last_record_mono_us_ = now_us;
	points_.fetch_add(1);
	return true;
}

void IngestionLoop::drain_() {
	Result res = p_.checkpointer.flush();
	if (!res.ok()) {
		last_error_ = res;
		ANEMO_LOGE("loop", "final checkpoint failed: " + res.msg);
	}
	close_();
}

void IngestionLoop::close_() {
	p_.writer.close();
	p_.checkpointer.close();
	transport_.close();
	closed_mono_us_ = ctx_.clock.monoUs();
	setState_(LoopState::Closed);

	const SessionSummary s = summary();
	char rate[32];
	std::snprintf(rate, sizeof(rate), "%.1f", s.average_rate_hz);
	ANEMO_LOGI("loop", "session summary points=" + std::to_string(s.points) +
						   " runtime=" +
						   anemo::core::Time::formatDuration(s.runtime_us) +
						   " avg_rate_hz=" + rate +
						   " parameters=" + std::to_string(s.parameters));
}

void IngestionLoop::dumpStats_() {
	const auto rows = p_.stats.snapshot();
	ANEMO_LOGI("stats", "current statistics (" + std::to_string(rows.size()) +
							" parameters)");
	for (const auto &s : rows) {
		char buf[64];
		std::snprintf(buf, sizeof(buf), "%.3f", s.last);
		ANEMO_LOGI("stats", "  " + s.name + ": " + buf +
								" (count: " + std::to_string(s.count) + ")");
	}
}

SessionSummary IngestionLoop::summary() const {
	SessionSummary s;
	s.points = points_.load();
	const uint64_t end_us =
		(state_ == LoopState::Closed) ? closed_mono_us_ : ctx_.clock.monoUs();
	s.runtime_us =
		(started_ && end_us > started_mono_us_) ? end_us - started_mono_us_ : 0;
	if (s.runtime_us > 0)
		s.average_rate_hz = (double)s.points * 1e6 / (double)s.runtime_us;
	s.parameters = p_.stats.parameterCount();
	return s;
}

} // namespace app

#include <anemo/core/Log.hpp>
#include <anemo/core/Time.hpp>

#include <inttypes.h>

namespace anemo::core {

const char *levelName(LogLevel lv) {
	switch (lv) {
	case LogLevel::Trace:
		return "TRACE";
	case LogLevel::Debug:
		return "DEBUG";
	case LogLevel::Info:
		return "INFO";
	case LogLevel::Warn:
		return "WARN";
	case LogLevel::Error:
		return "ERROR";
	case LogLevel::Fatal:
		return "FATAL";
	}
	return "UNK";
}

static void writeLine(FILE *fp, const LogRecord &r) {
	const std::string ts = Time::formatIso(r.ts_us);
	std::fprintf(fp, "%s %-5s %-12s %s\n", ts.c_str(), levelName(r.level),
				 r.tag.c_str(), r.msg.c_str());
	std::fflush(fp);
}

void ConsoleSink::write(const LogRecord &r) { writeLine(stderr, r); }

FileSink::FileSink(std::string path) : path_(std::move(path)) {
	fp_ = std::fopen(path_.c_str(), "a");
	if (!fp_)
		std::fprintf(stderr, "FileSink: failed to open '%s'\n", path_.c_str());
}

FileSink::~FileSink() {
	if (fp_)
		std::fclose(fp_);
}

void FileSink::write(const LogRecord &r) {
	if (!fp_)
		return;
	writeLine(fp_, r);
}

Logger &Logger::instance() {
	static Logger logger;
	return logger;
}

Logger::Logger()
	: console_sink_(std::make_shared< ConsoleSink >()),
	  th_(&Logger::worker_, this) {}

Logger::~Logger() { shutdown(); }

void Logger::addSink(std::shared_ptr< ILogSink > sink) {
	if (!sink)
		return;
	std::lock_guard< std::mutex > lk(sinks_mtx_);
	sinks_.push_back(std::move(sink));
}

void Logger::setConsoleEnabled(bool enabled) {
	console_enabled_.store(enabled);
}

void Logger::log(LogLevel lv, std::string tag, std::string msg) {
	if (!enabled(lv))
		return;
	LogRecord r{};
	r.ts_us = Time::wallUs();
	r.level = lv;
	r.tag = std::move(tag);
	r.msg = std::move(msg);

	if (!running_.load()) {
		// worker already gone; write synchronously so late messages survive
		dispatch_(r);
		return;
	}
	{
		std::lock_guard< std::mutex > lk(mtx_);
		q_.push_back(std::move(r));
	}
	cv_.notify_one();
}

void Logger::flush() {
	if (!running_.load())
		return;
	std::unique_lock< std::mutex > lk(mtx_);
	drained_cv_.wait(lk, [&] { return q_.empty() && !busy_; });
}

void Logger::shutdown() {
	if (!running_.exchange(false))
		return;
	cv_.notify_all();
	if (th_.joinable())
		th_.join();
}

void Logger::dispatch_(const LogRecord &r) {
	if (console_enabled_.load())
		console_sink_->write(r);
	std::lock_guard< std::mutex > lk(sinks_mtx_);
	for (auto &s : sinks_)
		s->write(r);
}

void Logger::worker_() {
	while (true) {
		LogRecord r{};
		{
			std::unique_lock< std::mutex > lk(mtx_);
			cv_.wait(lk, [&] { return !q_.empty() || !running_.load(); });
			if (q_.empty()) {
				drained_cv_.notify_all();
				if (!running_.load())
					break;
				continue;
			}
			r = std::move(q_.front());
			q_.pop_front();
			busy_ = true;
		}
		dispatch_(r);
		{
			std::lock_guard< std::mutex > lk(mtx_);
			busy_ = false;
			if (q_.empty())
				drained_cv_.notify_all();
		}
	}
}

} // namespace anemo::core

#include "io/StatsLog.h"

#include "config/Config.h"

#include <anemo/core/Time.hpp>

#include <errno.h>
#include <cstdio>
#include <string.h>
#include <utility>

namespace io {

using anemo::Errc;
using anemo::Result;

// %.6f of a large finite double runs to hundreds of digits.
static void appendFixed6(std::string &out, double v) {
	const int n = std::snprintf(nullptr, 0, "%.6f", v);
	if (n <= 0)
		return;
	std::string buf((size_t)n + 1, '\0');
	std::snprintf(&buf[0], buf.size(), "%.6f", v);
	buf.resize((size_t)n);
	out += buf;
}

std::string formatStatsRow(const std::string &timestamp,
						   const stats::ParameterSummary &s) {
	std::string row = timestamp + "," + s.name;
	for (double v : {s.min, s.max, s.mean, s.std_dev}) {
		row += ',';
		appendFixed6(row, v);
	}
	row += ',';
	row += std::to_string(s.count);
	return row;
}

StatsLog::StatsLog(std::string path) : path_(std::move(path)) {}

StatsLog::~StatsLog() { close(); }

Result StatsLog::open() {
	close();
	fp_ = fopen(path_.c_str(), "w");
	if (!fp_)
		return Result::Fail(Errc::Io, "open " + path_ + ": " + strerror(errno));
	if (fprintf(fp_, "%s\n", cfg::STATS_HEADER) < 0 || fflush(fp_) != 0)
		return Result::Fail(Errc::Io, "write " + path_ + ": " + strerror(errno));
	rows_ = 0;
	return Result::Ok();
}

Result StatsLog::append(uint64_t wall_us,
						const std::vector< stats::ParameterSummary > &rows) {
	if (!fp_)
		return Result::Fail(Errc::NotReady, "statistics log not open");
	if (rows.empty())
		return Result::Ok();

	const std::string ts = anemo::core::Time::formatIso(wall_us);
	for (const auto &s : rows) {
		if (fprintf(fp_, "%s\n", formatStatsRow(ts, s).c_str()) < 0)
			return Result::Fail(Errc::Io,
								"write " + path_ + ": " + strerror(errno));
		++rows_;
	}
	if (fflush(fp_) != 0)
		return Result::Fail(Errc::Io, "flush " + path_ + ": " + strerror(errno));
	return Result::Ok();
}

void StatsLog::close() {
	if (fp_)
		fclose(fp_);
	fp_ = nullptr;
}

} // namespace io

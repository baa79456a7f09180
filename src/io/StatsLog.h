#pragma once

#include "stats/StatisticsEngine.h"

#include <anemo/core/Result.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace io {

// timestamp,parameter,min,max,mean,std_dev,count with 6 decimals.
class StatsLog {
public:
	explicit StatsLog(std::string path);
	~StatsLog();

	StatsLog(const StatsLog &) = delete;
	StatsLog &operator=(const StatsLog &) = delete;

	// Truncates the file and writes the header.
	anemo::Result open();
	anemo::Result append(uint64_t wall_us,
						 const std::vector< stats::ParameterSummary > &rows);
	void close();

	bool isOpen() const { return fp_ != nullptr; }
	uint64_t rowsWritten() const { return rows_; }
	const std::string &path() const { return path_; }

private:
	std::string path_;
	FILE *fp_ = nullptr;
	uint64_t rows_ = 0;
};

std::string formatStatsRow(const std::string &timestamp,
						   const stats::ParameterSummary &s);

} // namespace io

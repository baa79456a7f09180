#include <doctest/doctest.h>

#include "TestSupport.h"
#include "app/Checkpointer.h"
#include "io/StatsLog.h"
#include "stats/StatisticsEngine.h"

#include <string>

TEST_CASE("StatsLog formats rows with six decimals") {
	stats::ParameterSummary s;
	s.name = "S";
	s.min = 5.0;
	s.max = 7.0;
	s.mean = 6.0;
	s.std_dev = 0.816496580927726;
	s.count = 3;
	CHECK(io::formatStatsRow("TS", s) ==
		  "TS,S,5.000000,7.000000,6.000000,0.816497,3");
}

TEST_CASE("StatsLog keeps every column for huge magnitudes") {
	stats::ParameterSummary s;
	s.name = "S";
	s.min = -1e300;
	s.max = 1e300;
	s.mean = 0.0;
	s.std_dev = 1e299;
	s.count = 42;
	const std::string row = io::formatStatsRow("TS", s);
	const auto cols = testing::splitCsv(row);
	REQUIRE(cols.size() == 7);
	CHECK(cols[1] == "S");
	CHECK(cols[2].size() > 300);
	CHECK(cols[2].front() == '-');
	CHECK(cols[4] == "0.000000");
	CHECK(cols[6] == "42");
}

TEST_CASE("Checkpointer with no parameters writes nothing") {
	testing::TempDir dir;
	testing::FakeClock clock;
	stats::StatisticsEngine eng(150);
	io::StatsLog log(dir.file("stats.csv"));
	REQUIRE(log.open().ok());
	app::Checkpointer cp(eng, &log, 10, 0, clock);

	CHECK(cp.flush().ok());
	CHECK(cp.flush().ok());
	CHECK(cp.flushes() == 0);
	cp.close();
	const auto lines = testing::readLines(dir.file("stats.csv"));
	REQUIRE(lines.size() == 1);
	CHECK(lines[0] == "timestamp,parameter,min,max,mean,std_dev,count");
}

TEST_CASE("Checkpointer flushes on the point cadence") {
	testing::TempDir dir;
	testing::FakeClock clock;
	stats::StatisticsEngine eng(150);
	io::StatsLog log(dir.file("stats.csv"));
	REQUIRE(log.open().ok());
	app::Checkpointer cp(eng, &log, 3, 0, clock);

	eng.update("S", "1");
	eng.update("T", "2");
	for (uint64_t pts = 1; pts <= 6; ++pts)
		REQUIRE(cp.maybeCheckpoint(pts).ok());
	// repeated calls at the same count do not flush again
	REQUIRE(cp.maybeCheckpoint(6).ok());
	REQUIRE(cp.maybeCheckpoint(6).ok());
	CHECK(cp.flushes() == 2);
	cp.close();

	const auto lines = testing::readLines(dir.file("stats.csv"));
	CHECK(lines.size() == 1 + 2 * 2);
}

TEST_CASE("Checkpointer flushes on the wall-clock cadence") {
	testing::TempDir dir;
	testing::FakeClock clock;
	stats::StatisticsEngine eng(150);
	io::StatsLog log(dir.file("stats.csv"));
	REQUIRE(log.open().ok());
	app::Checkpointer cp(eng, &log, 0, 1000, clock);
	eng.update("D", "90");

	clock.advanceMs(999);
	REQUIRE(cp.maybeCheckpoint(1).ok());
	CHECK(cp.flushes() == 0);
	clock.advanceMs(1);
	REQUIRE(cp.maybeCheckpoint(1).ok());
	CHECK(cp.flushes() == 1);
	clock.advanceMs(500);
	REQUIRE(cp.maybeCheckpoint(2).ok());
	CHECK(cp.flushes() == 1);
}

TEST_CASE("Checkpointer without a log is a no-op") {
	testing::FakeClock clock;
	stats::StatisticsEngine eng(150);
	eng.update("S", "1");
	app::Checkpointer cp(eng, nullptr, 1, 0, clock);
	CHECK(cp.maybeCheckpoint(1).ok());
	CHECK(cp.flush().ok());
	CHECK(cp.flushes() == 0);
}

TEST_CASE("StatsLog append before open is an error") {
	io::StatsLog log("/nonexistent/stats.csv");
	CHECK(log.open().code == anemo::Errc::Io);
	stats::ParameterSummary s;
	s.name = "S";
	CHECK(log.append(0, {s}).code == anemo::Errc::NotReady);
}

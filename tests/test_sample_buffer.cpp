#include <doctest/doctest.h>

#include "ingest/LineParser.h"
#include "stats/SampleBuffer.h"

#include <string>
#include <vector>

namespace {

ingest::Record rec(const std::string &line, uint64_t ts) {
	ingest::LineParser p;
	ingest::Record r;
	r.ts_us = ts;
	r.raw_line = line;
	r.fields = p.parse(line);
	return r;
}

} // namespace

TEST_CASE("classify uses the fixed category table") {
	CHECK(stats::classify("S") == stats::Category::WindSpeed);
	CHECK(stats::classify("S2") == stats::Category::WindSpeed);
	CHECK(stats::classify("T") == stats::Category::Temperature);
	CHECK(stats::classify("D") == stats::Category::WindDirection);
	CHECK_FALSE(stats::classify("T1").has_value());
	CHECK_FALSE(stats::classify("DD").has_value());
	CHECK_FALSE(stats::classify("SX").has_value());
	CHECK_FALSE(stats::classify("H").has_value());
}

TEST_CASE("SampleBuffer routes numeric values into category series") {
	stats::SampleBuffer buf(10, 10);
	buf.push(rec("S 5.0, S2 5.5, T 20.0, D 270, H 40", 1));
	buf.push(rec("S x, T 21.0", 2));

	CHECK(buf.series(stats::Category::WindSpeed) ==
		  std::vector< double >{5.0, 5.5});
	CHECK(buf.series(stats::Category::Temperature) ==
		  std::vector< double >{20.0, 21.0});
	CHECK(buf.series(stats::Category::WindDirection) ==
		  std::vector< double >{270.0});
	CHECK(buf.timestamps() == std::vector< uint64_t >{1, 2});
}

TEST_CASE("SampleBuffer bounds every collection independently") {
	stats::SampleBuffer buf(3, 2);
	for (int i = 0; i < 5; ++i)
		buf.push(rec("T " + std::to_string(i), (uint64_t)i));

	CHECK(buf.size() == 3);
	CHECK(buf.series(stats::Category::Temperature) ==
		  std::vector< double >{3.0, 4.0});
	CHECK(buf.timestamps().size() == 2);

	const auto recent = buf.recent(10);
	REQUIRE(recent.size() == 3);
	CHECK(recent.front().raw_line == "T 2");
	CHECK(recent.back().raw_line == "T 4");
	REQUIRE(buf.latest().has_value());
	CHECK(buf.latest()->raw_line == "T 4");
	CHECK(buf.recent(1).size() == 1);
	CHECK(buf.recent(0).empty());
}

TEST_CASE("SampleBuffer latest is empty before the first push") {
	stats::SampleBuffer buf(3, 3);
	CHECK_FALSE(buf.latest().has_value());
	CHECK(buf.recent(5).empty());
}

TEST_CASE("SampleBuffer reports its capacities") {
	stats::SampleBuffer buf(1500, 75);
	CHECK(buf.recordCapacity() == 1500);
	CHECK(buf.seriesCapacity() == 75);
	CHECK(buf.size() == 0);
}

#include <doctest/doctest.h>

#include "ingest/LineParser.h"

#include <string>
#include <utility>
#include <vector>

namespace {

std::vector< std::pair< std::string, std::string > >
pairs(const ingest::FieldMap &m) {
	return {m.begin(), m.end()};
}

} // namespace

TEST_CASE("LineParser splits comma separated name/value segments") {
	ingest::LineParser p;
	auto m = p.parse("S 05.12, S2 05.10, D 270, T 21.4, H 45.2");
	REQUIRE(m.size() == 5);
	CHECK(pairs(m)[0] == std::make_pair(std::string("S"), std::string("05.12")));
	CHECK(pairs(m)[2] == std::make_pair(std::string("D"), std::string("270")));
	CHECK(*m.find("H") == "45.2");
}

TEST_CASE("LineParser skips segments without a name and value") {
	ingest::LineParser p;
	auto m = p.parse("S 5.0,,T,  , D 180 ,X ");
	REQUIRE(m.size() == 2);
	CHECK(*m.find("S") == "5.0");
	CHECK(*m.find("D") == "180");
	CHECK(m.find("T") == nullptr);
	CHECK(m.find("X") == nullptr);
}

TEST_CASE("LineParser keeps everything after the first space as the value") {
	ingest::LineParser p;
	auto m = p.parse("S 5.0, ST sensor ok");
	CHECK(*m.find("ST") == "sensor ok");
}

TEST_CASE("LineParser pairs whitespace separated tokens") {
	ingest::LineParser p;
	auto m = p.parse("S 5.0   T\t20.0 D");
	REQUIRE(m.size() == 2);
	CHECK(*m.find("S") == "5.0");
	CHECK(*m.find("T") == "20.0");
	CHECK(m.find("D") == nullptr);
}

TEST_CASE("LineParser degrades to an empty mapping on garbage") {
	ingest::LineParser p;
	CHECK(p.parse("garbage").empty());
	CHECK(p.parse("").empty());
	CHECK(p.parse("   ").empty());
	CHECK(p.parse(",,,").empty());
}

TEST_CASE("LineParser output is deterministic") {
	ingest::LineParser p;
	const std::string line = "S 1 T 2 D 3 X";
	CHECK(pairs(p.parse(line)) == pairs(p.parse(line)));
	CHECK(p.parse(line).size() == 3);
}

TEST_CASE("LineParser keeps first position for a repeated name") {
	ingest::LineParser p;
	auto m = p.parse("S 1, T 2, S 3");
	REQUIRE(m.size() == 2);
	CHECK(m.begin()->first == "S");
	CHECK(*m.find("S") == "3");
}

#include <doctest/doctest.h>

#include <anemo/serial/LineReader.hpp>

#include <string>
#include <vector>

namespace {

std::vector< std::string > feed(anemo::serial::LineReader &r,
								const std::string &bytes) {
	std::vector< std::string > out;
	for (char c : bytes) {
		if (r.push((uint8_t)c)) {
			out.push_back(r.line());
			r.consumeLine();
		}
	}
	return out;
}

} // namespace

TEST_CASE("LineReader splits on newline and drops carriage returns") {
	anemo::serial::LineReader r;
	const auto lines = feed(r, "S 1, T 2\r\nS 3");
	REQUIRE(lines.size() == 1);
	CHECK(lines[0] == "S 1, T 2");
	const auto more = feed(r, ", T 4\r\n");
	REQUIRE(more.size() == 1);
	CHECK(more[0] == "S 3, T 4");
}

TEST_CASE("LineReader drops non-printable bytes") {
	anemo::serial::LineReader r;
	const std::string noisy = std::string("S\x01 5\xff") + "\n";
	const auto lines = feed(r, noisy);
	REQUIRE(lines.size() == 1);
	CHECK(lines[0] == "S 5");
}

TEST_CASE("LineReader discards overlong lines") {
	anemo::serial::LineReader r(8);
	const auto lines = feed(r, "0123456789ABCDEF\nS 1\n");
	REQUIRE(lines.size() == 1);
	CHECK(lines[0] == "S 1");
	CHECK(r.overflows() == 1);
}

TEST_CASE("LineReader holds a completed line until consumed") {
	anemo::serial::LineReader r;
	for (char c : std::string("S 1\nT 2\n"))
		r.push((uint8_t)c);
	REQUIRE(r.hasLine());
	CHECK(r.line() == "S 1");
	r.consumeLine();
	CHECK_FALSE(r.hasLine());
}

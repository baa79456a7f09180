#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace anemo::serial {

/** Reassembles newline-terminated ASCII lines from a byte stream.
 *
 * '\r' is discarded, '\n' terminates a line. Bytes outside printable ASCII
 * and tab are dropped. A line longer than max_len is discarded up to its
 * terminator and counted in overflows(). */
class LineReader {
public:
	explicit LineReader(size_t max_len = 1024) : max_len_(max_len) {}

	// returns true when a complete line became available
	bool push(uint8_t b);

	bool hasLine() const { return ready_; }
	// bytes of an unterminated line are buffered
	bool hasPartial() const { return !buf_.empty() && !discarding_; }
	const std::string &line() const { return line_; }
	void consumeLine();

	void reset();
	uint32_t overflows() const { return overflows_; }

private:
	size_t max_len_;
	std::string buf_;
	std::string line_;
	bool ready_ = false;
	bool discarding_ = false;
	uint32_t overflows_ = 0;
};

} // namespace anemo::serial

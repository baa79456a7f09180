#include <anemo/serial/LineReader.hpp>

namespace anemo::serial {

bool LineReader::push(uint8_t b) {
	if (ready_)
		return false;

	if (b == '\n') {
		if (discarding_) {
			discarding_ = false;
			buf_.clear();
			return false;
		}
		line_.swap(buf_);
		buf_.clear();
		ready_ = true;
		return true;
	}
	if (discarding_ || b == '\r')
		return false;
	if (b != '\t' && (b < 0x20 || b > 0x7e))
		return false;

	if (buf_.size() >= max_len_) {
		discarding_ = true;
		buf_.clear();
		++overflows_;
		return false;
	}
	buf_.push_back((char)b);
	return false;
}

void LineReader::consumeLine() {
	line_.clear();
	ready_ = false;
}

void LineReader::reset() {
	buf_.clear();
	line_.clear();
	ready_ = false;
	discarding_ = false;
}

} // namespace anemo::serial

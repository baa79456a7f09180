#include "transport/SerialTransport.h"

#include "config/Config.h"

#include <anemo/core/Time.hpp>

#include <utility>

namespace transport {

using anemo::Errc;
using anemo::Result;

SerialTransport::SerialTransport(std::string dev, int baud)
	: dev_(std::move(dev)), baud_(baud), reader_(cfg::MAX_LINE_BYTES) {}

SerialTransport::~SerialTransport() { close(); }

Result SerialTransport::open() {
	pending_.clear();
	pending_pos_ = 0;
	reader_.reset();
	return uart_.open(dev_, baud_);
}

// Feeds buffered bytes to the reader until a line completes.
bool SerialTransport::takeLine_(std::string &out) {
	while (pending_pos_ < pending_.size()) {
		if (reader_.push(pending_[pending_pos_++])) {
			out = reader_.line();
			reader_.consumeLine();
			return true;
		}
	}
	pending_.clear();
	pending_pos_ = 0;
	return false;
}

Result SerialTransport::readLine(int timeout_ms, std::string &out) {
	out.clear();
	if (!uart_.isOpen())
		return Result::Fail(Errc::Closed, dev_ + " not open");

	const uint64_t deadline_us =
		anemo::core::Time::us() + (uint64_t)(timeout_ms < 0 ? 0 : timeout_ms) * 1000ULL;
	while (true) {
		if (takeLine_(out))
			return Result::Ok();

		const uint64_t now_us = anemo::core::Time::us();
		if (now_us >= deadline_us)
			return Result::Fail(Errc::Timeout, "");
		const int wait_ms = (int)((deadline_us - now_us + 999ULL) / 1000ULL);

		uint8_t buf[cfg::SERIAL_READ_BUF_SIZE];
		const int n = uart_.read(buf, (int)sizeof(buf), wait_ms);
		if (n < 0)
			return Result::Fail(Errc::Io, "read " + dev_ + " failed");
		pending_.insert(pending_.end(), buf, buf + n);
	}
}

void SerialTransport::close() { uart_.close(); }

std::string SerialTransport::describe() const {
	return dev_ + "@" + std::to_string(baud_);
}

} // namespace transport

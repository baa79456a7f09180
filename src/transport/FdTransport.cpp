#include "transport/FdTransport.h"

#include "config/Config.h"

#include <anemo/core/Time.hpp>

#include <errno.h>
#include <poll.h>
#include <unistd.h>
#include <utility>

namespace transport {

using anemo::Errc;
using anemo::Result;

FdTransport::FdTransport(int fd, std::string name)
	: fd_(fd), name_(std::move(name)), reader_(cfg::MAX_LINE_BYTES) {}

bool FdTransport::takeLine_(std::string &out) {
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

// >0 bytes read, 0 nothing yet (timeout, EINTR or end of input), -1 error
int FdTransport::readSome_(uint8_t *buf, int cap, int timeout_ms) {
	pollfd pfd{fd_, POLLIN, 0};
	const int r = ::poll(&pfd, 1, timeout_ms);
	if (r < 0)
		return (errno == EINTR) ? 0 : -1;
	if (r == 0)
		return 0;
	if (pfd.revents & (POLLERR | POLLNVAL))
		return -1;
	const ssize_t n = ::read(fd_, buf, (size_t)cap);
	if (n < 0)
		return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? 0
																		   : -1;
	if (n == 0) {
		eof_ = true;
		if (reader_.hasPartial())
			pending_.push_back('\n');
	}
	return (int)n;
}

Result FdTransport::readLine(int timeout_ms, std::string &out) {
	out.clear();
	if (closed_ || fd_ < 0)
		return Result::Fail(Errc::Closed, name_ + " closed");

	const uint64_t deadline_us =
		anemo::core::Time::us() + (uint64_t)(timeout_ms < 0 ? 0 : timeout_ms) * 1000ULL;
	while (true) {
		if (takeLine_(out))
			return Result::Ok();
		if (eof_)
			return Result::Fail(Errc::Closed, "end of " + name_);

		const uint64_t now_us = anemo::core::Time::us();
		if (now_us >= deadline_us)
			return Result::Fail(Errc::Timeout, "");
		const int wait_ms = (int)((deadline_us - now_us + 999ULL) / 1000ULL);

		uint8_t buf[cfg::SERIAL_READ_BUF_SIZE];
		const int n = readSome_(buf, (int)sizeof(buf), wait_ms);
		if (n < 0)
			return Result::Fail(Errc::Io, "read " + name_ + " failed");
		pending_.insert(pending_.end(), buf, buf + n);
	}
}

} // namespace transport

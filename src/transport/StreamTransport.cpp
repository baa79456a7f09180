#include "transport/StreamTransport.h"

#include <utility>

namespace transport {

using anemo::Errc;
using anemo::Result;

StreamTransport::StreamTransport(std::istream &in, std::string name)
	: in_(&in), name_(std::move(name)) {}

StreamTransport::StreamTransport(std::unique_ptr< std::istream > owned,
								 std::string name)
	: owned_(std::move(owned)), in_(owned_.get()), name_(std::move(name)) {}

Result StreamTransport::readLine(int timeout_ms, std::string &out) {
	(void)timeout_ms;
	out.clear();
	if (closed_ || !in_)
		return Result::Fail(Errc::Closed, name_ + " closed");
	if (!std::getline(*in_, out)) {
		if (in_->bad())
			return Result::Fail(Errc::Io, "read " + name_ + " failed");
		return Result::Fail(Errc::Closed, "end of " + name_);
	}
	while (!out.empty() && out.back() == '\r')
		out.pop_back();
	return Result::Ok();
}

void StreamTransport::close() {
	closed_ = true;
	owned_.reset();
	in_ = nullptr;
}

} // namespace transport

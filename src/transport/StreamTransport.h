#pragma once

#include "transport/ILineTransport.h"

#include <istream>
#include <memory>
#include <string>

namespace transport {

// Replays lines from a captured file or stdin. End of input is Closed.
class StreamTransport final : public ILineTransport {
public:
	StreamTransport(std::istream &in, std::string name);
	StreamTransport(std::unique_ptr< std::istream > owned, std::string name);

	anemo::Result readLine(int timeout_ms, std::string &out) override;
	void close() override;
	std::string describe() const override { return name_; }

private:
	std::unique_ptr< std::istream > owned_;
	std::istream *in_;
	std::string name_;
	bool closed_ = false;
};

} // namespace transport

#pragma once

#include "transport/ILineTransport.h"

#include <anemo/serial/LineReader.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace transport {

/** Lines from a pipe or terminal descriptor (stdin), read with poll() so a
 * read never blocks past timeout_ms and signals only shorten the wait.
 * End of input is Closed; an unterminated last line is still delivered.
 * The descriptor is not owned. */
class FdTransport final : public ILineTransport {
public:
	FdTransport(int fd, std::string name);

	anemo::Result readLine(int timeout_ms, std::string &out) override;
	void close() override { closed_ = true; }
	std::string describe() const override { return name_; }

	uint32_t overflows() const { return reader_.overflows(); }

private:
	bool takeLine_(std::string &out);
	int readSome_(uint8_t *buf, int cap, int timeout_ms);

	int fd_;
	std::string name_;
	anemo::serial::LineReader reader_;
	std::vector< uint8_t > pending_;
	size_t pending_pos_ = 0;
	bool eof_ = false;
	bool closed_ = false;
};

} // namespace transport

#pragma once

#include "transport/ILineTransport.h"

#include <anemo/serial/LineReader.hpp>
#include <anemo/serial/Uart.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace transport {

class SerialTransport final : public ILineTransport {
public:
	SerialTransport(std::string dev, int baud);
	~SerialTransport() override;

	anemo::Result open();
	anemo::Result readLine(int timeout_ms, std::string &out) override;
	void close() override;
	std::string describe() const override;

	uint32_t overflows() const { return reader_.overflows(); }

private:
	bool takeLine_(std::string &out);

	std::string dev_;
	int baud_;
	anemo::serial::Uart uart_;
	anemo::serial::LineReader reader_;
	std::vector< uint8_t > pending_;
	size_t pending_pos_ = 0;
};

} // namespace transport

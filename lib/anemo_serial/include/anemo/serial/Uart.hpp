#pragma once
#include <anemo/core/Result.hpp>

#include <cstdint>
#include <string>

namespace anemo::serial {

class Uart {
public:
	Uart() = default;
	~Uart();

	Uart(const Uart &) = delete;
	Uart &operator=(const Uart &) = delete;

	Result open(const std::string &dev, int baud);
	void close();

	bool isOpen() const { return _fd >= 0; }

	/** Waits up to timeout_ms for input. Returns bytes read, 0 on timeout,
	 * -1 on error or hang-up. */
	int read(uint8_t *buf, int cap, int timeout_ms);

	static bool supportedBaud(int baud);

private:
	int _fd = -1;
};

} // namespace anemo::serial

#include <anemo/serial/Uart.hpp>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

namespace anemo::serial {

static bool toSpeed(int baud, speed_t &out) {
	switch (baud) {
	case 9600:
		out = B9600;
		return true;
	case 19200:
		out = B19200;
		return true;
	case 38400:
		out = B38400;
		return true;
	case 57600:
		out = B57600;
		return true;
	case 115200:
		out = B115200;
		return true;
	case 230400:
		out = B230400;
		return true;
	case 460800:
		out = B460800;
		return true;
	case 921600:
		out = B921600;
		return true;
	default:
		return false;
	}
}

bool Uart::supportedBaud(int baud) {
	speed_t sp{};
	return toSpeed(baud, sp);
}

Uart::~Uart() { close(); }

Result Uart::open(const std::string &dev, int baud) {
	close();
	speed_t sp{};
	if (!toSpeed(baud, sp))
		return Result::Fail(Errc::Invalid,
							"unsupported baud " + std::to_string(baud));

	_fd = ::open(dev.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
	if (_fd < 0)
		return Result::Fail(Errc::Io, "open " + dev + ": " + strerror(errno));

	termios tio{};
	if (tcgetattr(_fd, &tio) != 0) {
		const int err = errno;
		close();
		return Result::Fail(Errc::Io, "tcgetattr " + dev + ": " + strerror(err));
	}

	// 8N1, raw, no flow control
	cfmakeraw(&tio);
	tio.c_cflag |= (CLOCAL | CREAD);
	tio.c_cflag &= ~CRTSCTS;
	tio.c_cflag &= ~CSTOPB;
	tio.c_cflag &= ~PARENB;
	tio.c_cflag &= ~CSIZE;
	tio.c_cflag |= CS8;

	cfsetispeed(&tio, sp);
	cfsetospeed(&tio, sp);

	tio.c_cc[VTIME] = 0;
	tio.c_cc[VMIN] = 0;

	if (tcsetattr(_fd, TCSANOW, &tio) != 0) {
		const int err = errno;
		close();
		return Result::Fail(Errc::Io, "tcsetattr " + dev + ": " + strerror(err));
	}
	tcflush(_fd, TCIFLUSH);

	return Result::Ok();
}

void Uart::close() {
	if (_fd >= 0)
		::close(_fd);
	_fd = -1;
}

int Uart::read(uint8_t *buf, int cap, int timeout_ms) {
	if (_fd < 0)
		return -1;
	pollfd pfd{_fd, POLLIN, 0};
	int r = ::poll(&pfd, 1, timeout_ms);
	if (r < 0)
		return (errno == EINTR) ? 0 : -1;
	if (r == 0)
		return 0;
	if (pfd.revents & (POLLERR | POLLNVAL))
		return -1;
	int n = (int)::read(_fd, buf, (size_t)cap);
	if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
		return 0;
	if (n == 0 && (pfd.revents & POLLHUP))
		return -1;
	return n;
}

} // namespace anemo::serial

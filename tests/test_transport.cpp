#include <doctest/doctest.h>

#include "transport/FdTransport.h"
#include "transport/SerialTransport.h"
#include "transport/StreamTransport.h"

#include <anemo/core/Signal.hpp>
#include <anemo/serial/Uart.hpp>

#include <chrono>
#include <csignal>
#include <pthread.h>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

struct Pipe {
	Pipe() {
		if (::pipe(fds) != 0)
			fds[0] = fds[1] = -1;
	}
	~Pipe() {
		closeWrite();
		if (fds[0] >= 0)
			::close(fds[0]);
	}
	bool send(const std::string &s) {
		return ::write(fds[1], s.data(), s.size()) == (ssize_t)s.size();
	}
	void closeWrite() {
		if (fds[1] >= 0)
			::close(fds[1]);
		fds[1] = -1;
	}
	int fds[2];
};

} // namespace

TEST_CASE("StreamTransport yields lines then Closed") {
	std::istringstream in("S 1, T 2\r\n\nS 3\n");
	transport::StreamTransport t(in, "mem");
	std::string line;
	REQUIRE(t.readLine(10, line).ok());
	CHECK(line == "S 1, T 2");
	REQUIRE(t.readLine(10, line).ok());
	CHECK(line.empty());
	REQUIRE(t.readLine(10, line).ok());
	CHECK(line == "S 3");
	CHECK(t.readLine(10, line).code == anemo::Errc::Closed);
}

TEST_CASE("StreamTransport after close reports Closed") {
	std::istringstream in("S 1\n");
	transport::StreamTransport t(in, "mem");
	t.close();
	std::string line;
	CHECK(t.readLine(10, line).code == anemo::Errc::Closed);
}

TEST_CASE("SerialTransport reports open failures") {
	transport::SerialTransport missing("/dev/anemolog-does-not-exist", 115200);
	CHECK(missing.open().code == anemo::Errc::Io);
	std::string line;
	CHECK(missing.readLine(10, line).code == anemo::Errc::Closed);

	transport::SerialTransport bad_baud("/dev/null", 12345);
	CHECK(bad_baud.open().code == anemo::Errc::Invalid);
	CHECK(missing.describe() == "/dev/anemolog-does-not-exist@115200");
}

TEST_CASE("Uart knows the standard baud rates") {
	CHECK(anemo::serial::Uart::supportedBaud(115200));
	CHECK(anemo::serial::Uart::supportedBaud(9600));
	CHECK_FALSE(anemo::serial::Uart::supportedBaud(1234));
}

TEST_CASE("FdTransport reads lines with a bounded wait") {
	Pipe p;
	REQUIRE(p.fds[0] >= 0);
	transport::FdTransport t(p.fds[0], "pipe");
	std::string line;

	REQUIRE(p.send("S 1, T 2\r\nT 3"));
	REQUIRE(t.readLine(200, line).ok());
	CHECK(line == "S 1, T 2");
	CHECK(t.readLine(20, line).code == anemo::Errc::Timeout);
	CHECK(line.empty());

	// the unterminated last line still arrives at end of input
	p.closeWrite();
	REQUIRE(t.readLine(200, line).ok());
	CHECK(line == "T 3");
	CHECK(t.readLine(200, line).code == anemo::Errc::Closed);
	CHECK(t.describe() == "pipe");
}

TEST_CASE("FdTransport keeps reading across a statistics dump signal") {
	Pipe p;
	REQUIRE(p.fds[0] >= 0);
	struct sigaction old_int {}, old_term {}, old_usr1 {};
	sigaction(SIGINT, nullptr, &old_int);
	sigaction(SIGTERM, nullptr, &old_term);
	sigaction(SIGUSR1, nullptr, &old_usr1);
	volatile sig_atomic_t stop = 0;
	volatile sig_atomic_t dump = 0;
	anemo::core::setup_signal_handlers(&stop, &dump);

	transport::FdTransport t(p.fds[0], "stdin");
	const pthread_t reader = pthread_self();
	std::thread writer([&] {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		pthread_kill(reader, SIGUSR1);
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		p.send("S 5\n");
	});
	std::string line;
	const anemo::Result res = t.readLine(2000, line);
	writer.join();

	CHECK(res.ok());
	CHECK(line == "S 5");
	CHECK(dump == 1);
	CHECK(stop == 0);
	sigaction(SIGINT, &old_int, nullptr);
	sigaction(SIGTERM, &old_term, nullptr);
	sigaction(SIGUSR1, &old_usr1, nullptr);
}

TEST_CASE("FdTransport after close reports Closed") {
	Pipe p;
	transport::FdTransport t(p.fds[0], "pipe");
	REQUIRE(p.send("S 1\n"));
	t.close();
	std::string line;
	CHECK(t.readLine(10, line).code == anemo::Errc::Closed);
}

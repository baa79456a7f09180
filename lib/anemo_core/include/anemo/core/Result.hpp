#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace anemo {

enum class Errc : uint8_t {
	Ok = 0,
	Timeout,
	Io,
	Invalid,
	NotReady,
	Closed,
	Internal
};

inline const char *errcName(Errc c) {
	switch (c) {
	case Errc::Ok:
		return "ok";
	case Errc::Timeout:
		return "timeout";
	case Errc::Io:
		return "io";
	case Errc::Invalid:
		return "invalid";
	case Errc::NotReady:
		return "not_ready";
	case Errc::Closed:
		return "closed";
	case Errc::Internal:
		return "internal";
	}
	return "unknown";
}

struct Result {
	Errc code = Errc::Ok;
	std::string msg;

	bool ok() const { return code == Errc::Ok; }

	static Result Ok() { return {Errc::Ok, ""}; }
	static Result Fail(Errc c, std::string m) { return {c, std::move(m)}; }
};

} // namespace anemo

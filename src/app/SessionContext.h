#pragma once

#include "config/Params.h"

#include <anemo/core/Time.hpp>

#include <csignal>
#include <cstdint>

namespace app {

struct IClock {
	virtual ~IClock() = default;
	virtual uint64_t wallUs() const = 0;
	virtual uint64_t monoUs() const = 0;
};

class SystemClock final : public IClock {
public:
	uint64_t wallUs() const override { return anemo::core::Time::wallUs(); }
	uint64_t monoUs() const override { return anemo::core::Time::us(); }
};

// Async-signal-safe request flag; a handler may raise it.
class SignalFlag {
public:
	void raise() { flag_ = 1; }
	void clear() { flag_ = 0; }
	bool raised() const { return flag_ != 0; }
	volatile sig_atomic_t *raw() { return &flag_; }

private:
	volatile sig_atomic_t flag_ = 0;
};

/** Everything a logging session shares: tunables, the clock and the
 * cooperative stop / statistics-dump requests. */
struct SessionContext {
	explicit SessionContext(const cfg::SessionParams &p, const IClock &c)
		: params(p), clock(c) {}

	cfg::SessionParams params;
	const IClock &clock;
	SignalFlag stop;
	SignalFlag dump_stats;
};

} // namespace app

#pragma once

#include <csignal>

namespace anemo::core {

namespace {
static volatile sig_atomic_t *s_stop_flag = nullptr;
static volatile sig_atomic_t *s_dump_flag = nullptr;

static void signal_handler(int sig) {
	if (sig == SIGUSR1) {
		if (s_dump_flag)
			*s_dump_flag = 1;
		return;
	}
	if (s_stop_flag)
		*s_stop_flag = 1;
}
} // namespace

/** SIGINT/SIGTERM set *stop_flag to 1. When dump_flag is given, SIGUSR1 sets
 * *dump_flag to 1; the owner is expected to clear it after handling. */
inline void setup_signal_handlers(volatile sig_atomic_t *stop_flag,
								  volatile sig_atomic_t *dump_flag = nullptr) {
	s_stop_flag = stop_flag;
	s_dump_flag = dump_flag;
	struct sigaction sa {};
	sa.sa_handler = signal_handler;
	sigemptyset(&sa.sa_mask);
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
	if (dump_flag) {
		// a dump request must not fail blocking reads
		struct sigaction dump_sa = sa;
		dump_sa.sa_flags = SA_RESTART;
		sigaction(SIGUSR1, &dump_sa, nullptr);
	}
}

} // namespace anemo::core

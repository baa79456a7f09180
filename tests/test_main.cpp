#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <anemo/core/Log.hpp>

int main(int argc, char **argv) {
	auto &logger = anemo::core::Logger::instance();
	logger.setConsoleEnabled(false);
	logger.setLevel(anemo::core::LogLevel::Debug);

	doctest::Context context;
	context.applyCommandLine(argc, argv);
	const int rc = context.run();

	logger.shutdown();
	return rc;
}

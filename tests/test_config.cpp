#include <doctest/doctest.h>

#include "app/Console.h"
#include "config/Profile.h"

#include <anemo/core/Log.hpp>
#include <anemo/core/Path.hpp>
#include <anemo/core/Time.hpp>

#include <string>

TEST_CASE("profiles carry the per-host tunings") {
	cfg::Profile p = cfg::Profile::Linux;
	REQUIRE(cfg::parseProfile("windows", p));
	CHECK(p == cfg::Profile::Windows);
	CHECK_FALSE(cfg::parseProfile("amiga", p));
	CHECK(p == cfg::Profile::Windows);

	cfg::SessionParams base;
	base.strict_header = true;
	const cfg::SessionParams pi = cfg::applyProfile(base, cfg::Profile::Pi);
	CHECK(pi.stats_window == 100);
	CHECK(pi.record_capacity == 100);
	CHECK(pi.checkpoint_every_points == 0);
	CHECK(pi.checkpoint_interval_ms == 600000);
	CHECK(pi.display_refresh_ms == 1000);
	CHECK(pi.strict_header);

	const cfg::SessionParams linux_p = cfg::applyProfile(base, cfg::Profile::Linux);
	CHECK(linux_p.stats_window == 150);
	CHECK(linux_p.record_capacity == 1500);
	CHECK(linux_p.checkpoint_every_points == 200);
	CHECK(std::string(cfg::profileName(cfg::Profile::Mac)) == "mac");
}

TEST_CASE("time and path helpers") {
	CHECK(anemo::core::Time::formatDuration(0) == "0:00:00");
	CHECK(anemo::core::Time::formatDuration(3723500000ULL) == "1:02:03");
	CHECK(anemo::core::Time::fileStamp(1714564800ULL * 1000000ULL).size() == 17);
	CHECK(anemo::core::join_path("out", "a.csv") == "out/a.csv");
	CHECK(anemo::core::base_of("out/dir/a.csv") == "a.csv");
}

TEST_CASE("logger level gates records") {
	auto &logger = anemo::core::Logger::instance();
	const anemo::core::LogLevel prev = logger.level();
	logger.setLevel(anemo::core::LogLevel::Warn);
	CHECK_FALSE(logger.enabled(anemo::core::LogLevel::Info));
	CHECK(logger.enabled(anemo::core::LogLevel::Error));
	logger.setLevel(prev);
	CHECK(logger.level() == prev);
}

TEST_CASE("console diagnostics stay on until the live view starts") {
	CHECK(app::consoleAtStartup(false));
	CHECK_FALSE(app::consoleAtStartup(true));
	CHECK_FALSE(app::consoleWhileStreaming(false, true));
	CHECK(app::consoleWhileStreaming(false, false));
	CHECK_FALSE(app::consoleWhileStreaming(true, false));
}

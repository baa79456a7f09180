#include "app/Checkpointer.h"
#include "app/Console.h"
#include "app/IngestionLoop.h"
#include "app/SessionContext.h"
#include "config/Config.h"
#include "config/Params.h"
#include "config/Profile.h"
#include "display/DisplayRunner.h"
#include "display/TextDisplay.h"
#include "ingest/SchemaRegistry.h"
#include "io/RecordWriter.h"
#include "io/StatsLog.h"
#include "stats/SampleBuffer.h"
#include "stats/StatisticsEngine.h"
#include "transport/FdTransport.h"
#include "transport/SerialTransport.h"
#include "transport/StreamTransport.h"

#include <anemo/core/Log.hpp>
#include <anemo/core/Path.hpp>
#include <anemo/core/Signal.hpp>
#include <anemo/core/Time.hpp>
#include <anemo/serial/Uart.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

static const char *kVersion = "1.2.0";

static void print_usage(std::ostream &os) {
	os << "Usage:\n"
	   << "  anemolog --port <dev> [options]\n"
	   << "  anemolog --replay <file> [options]\n"
	   << "\n"
	   << "Input:\n"
	   << "  --port <dev|->            Serial device, or - for stdin.\n"
	   << "  --replay <file>           Replay a captured stream.\n"
	   << "  --baud <n>                Baud rate (default " << cfg::DEFAULT_BAUD
	   << ").\n"
	   << "\n"
	   << "Output:\n"
	   << "  --log-dir <dir>           Output directory (default "
	   << cfg::DEFAULT_LOG_DIR << ").\n"
	   << "  --strict-header           Rewrite the data log header when new\n"
	   << "                            parameters appear.\n"
	   << "  --no-stats                Do not write the statistics log.\n"
	   << "\n"
	   << "Tuning:\n"
	   << "  --profile <name>          linux|mac|pi|windows (default linux).\n"
	   << "  --window <K>              Statistics window, "
	   << cfg::STATS_WINDOW_MIN << ".." << cfg::STATS_WINDOW_MAX << ".\n"
	   << "  --checkpoint-points <n>   Checkpoint every n points (0 = off).\n"
	   << "  --checkpoint-ms <n>       Checkpoint every n ms (0 = off).\n"
	   << "\n"
	   << "Display:\n"
	   << "  --no-display              No live view.\n"
	   << "  --show-raw                Show the raw data stream.\n"
	   << "  --verbose                 Debug level diagnostics.\n"
	   << "  --quiet                   No diagnostics on the console.\n"
	   << "  --help, --version\n"
	   << "\n"
	   << "SIGUSR1 writes the current statistics to the diagnostic log.\n";
}

static bool parse_u32(const std::string &s, uint32_t &out) {
	if (s.empty() || s[0] == '-')
		return false;
	char *end = nullptr;
	errno = 0;
	const unsigned long v = std::strtoul(s.c_str(), &end, 10);
	if (errno != 0 || *end != '\0' || v > 0xffffffffUL)
		return false;
	out = (uint32_t)v;
	return true;
}

int main(int argc, char **argv) {
	std::string port;
	std::string replay;
	int baud = cfg::DEFAULT_BAUD;
	std::string log_dir = cfg::DEFAULT_LOG_DIR;
	cfg::Profile profile = cfg::Profile::Linux;
	bool have_window = false, have_cp_points = false, have_cp_ms = false;
	uint32_t window = 0, cp_points = 0, cp_ms = 0;
	bool strict_header = false, no_stats = false, show_raw = false;
	bool no_display = false, verbose = false, quiet = false;

	for (int i = 1; i < argc; ++i) {
		std::string a = argv[i];
		const bool has_val = i + 1 < argc;
		if (a == "--help" || a == "-h") {
			print_usage(std::cout);
			return 0;
		} else if (a == "--version") {
			std::cout << "anemolog v" << kVersion << "\n";
			return 0;
		} else if (a == "--port" && has_val) {
			port = argv[++i];
		} else if (a == "--replay" && has_val) {
			replay = argv[++i];
		} else if (a == "--baud" && has_val) {
			uint32_t v = 0;
			if (!parse_u32(argv[++i], v) || !anemo::serial::Uart::supportedBaud((int)v)) {
				std::cerr << "Invalid --baud value: " << argv[i] << "\n";
				return 2;
			}
			baud = (int)v;
		} else if (a == "--log-dir" && has_val) {
			log_dir = argv[++i];
		} else if (a == "--profile" && has_val) {
			if (!cfg::parseProfile(argv[++i], profile)) {
				std::cerr << "Unknown --profile: " << argv[i] << "\n";
				return 2;
			}
		} else if (a == "--window" && has_val) {
			have_window = parse_u32(argv[++i], window);
			if (!have_window || window < cfg::STATS_WINDOW_MIN ||
				window > cfg::STATS_WINDOW_MAX) {
				std::cerr << "Invalid --window (must be " << cfg::STATS_WINDOW_MIN
						  << ".." << cfg::STATS_WINDOW_MAX << ").\n";
				return 2;
			}
		} else if (a == "--checkpoint-points" && has_val) {
			have_cp_points = parse_u32(argv[++i], cp_points);
			if (!have_cp_points) {
				std::cerr << "Invalid --checkpoint-points value.\n";
				return 2;
			}
		} else if (a == "--checkpoint-ms" && has_val) {
			have_cp_ms = parse_u32(argv[++i], cp_ms);
			if (!have_cp_ms) {
				std::cerr << "Invalid --checkpoint-ms value.\n";
				return 2;
			}
		} else if (a == "--strict-header") {
			strict_header = true;
		} else if (a == "--no-stats") {
			no_stats = true;
		} else if (a == "--show-raw") {
			show_raw = true;
		} else if (a == "--no-display") {
			no_display = true;
		} else if (a == "--verbose") {
			verbose = true;
		} else if (a == "--quiet") {
			quiet = true;
		} else {
			std::cerr << "Unknown argument: " << a << "\n";
			print_usage(std::cerr);
			return 2;
		}
	}

	if (port.empty() == replay.empty()) {
		std::cerr << "Exactly one of --port or --replay is required.\n";
		print_usage(std::cerr);
		return 2;
	}
	if (port == "auto") {
		std::cerr << "Port auto-detection is not supported; pass the device "
					 "path, e.g. --port /dev/ttyUSB0\n";
		return 2;
	}

	cfg::SessionParams params = cfg::applyProfile(cfg::SessionParams{}, profile);
	if (have_window)
		params.stats_window = window;
	if (have_cp_points)
		params.checkpoint_every_points = cp_points;
	if (have_cp_ms)
		params.checkpoint_interval_ms = cp_ms;
	params.strict_header = strict_header;
	params.save_statistics = !no_stats;
	params.show_raw = show_raw;

	std::string err;
	if (!anemo::core::ensure_dir(log_dir, &err)) {
		std::cerr << err << "\n";
		return 1;
	}

	auto &logger = anemo::core::Logger::instance();
	logger.setLevel(verbose ? anemo::core::LogLevel::Debug
							: anemo::core::LogLevel::Info);
	logger.setConsoleEnabled(app::consoleAtStartup(quiet));
	logger.addSink(std::make_shared< anemo::core::FileSink >(
		anemo::core::join_path(log_dir, cfg::DIAG_LOG_NAME)));

	app::SystemClock clock;
	app::SessionContext ctx(params, clock);
	anemo::core::setup_signal_handlers(ctx.stop.raw(), ctx.dump_stats.raw());

	const std::string stamp = anemo::core::Time::fileStamp(clock.wallUs());
	const std::string data_path = anemo::core::join_path(
		log_dir, std::string(cfg::DATA_FILE_PREFIX) + stamp + ".csv");
	const std::string stats_path = anemo::core::join_path(
		log_dir, std::string(cfg::STATS_FILE_PREFIX) + stamp + ".csv");

	ANEMO_LOGI("main",
			   std::string("starting v") + kVersion +
				   " profile=" + cfg::profileName(profile) +
				   " window=" + std::to_string(params.stats_window) +
				   " records=" + std::to_string(params.record_capacity) +
				   " series=" + std::to_string(params.series_capacity) +
				   " checkpoint_points=" +
				   std::to_string(params.checkpoint_every_points) +
				   " checkpoint_ms=" +
				   std::to_string(params.checkpoint_interval_ms) +
				   (params.strict_header ? " strict_header" : ""));

	// Idle -> Connected happens once the transport is acquired here.
	std::unique_ptr< transport::ILineTransport > link;
	if (!replay.empty()) {
		auto in = std::make_unique< std::ifstream >(replay);
		if (!*in) {
			ANEMO_LOGF("main", "failed to open replay file " + replay);
			logger.shutdown();
			return 1;
		}
		link = std::make_unique< transport::StreamTransport >(std::move(in),
															  replay);
	} else if (port == "-") {
		link = std::make_unique< transport::FdTransport >(STDIN_FILENO, "stdin");
	} else {
		auto serial = std::make_unique< transport::SerialTransport >(port, baud);
		anemo::Result res = serial->open();
		if (!res.ok()) {
			ANEMO_LOGF("main", "connection failed: " + res.msg);
			logger.shutdown();
			return 1;
		}
		link = std::move(serial);
	}

	ingest::SchemaRegistry schema;
	io::RecordWriter writer(data_path, schema,
							params.strict_header ? io::HeaderMode::Strict
												 : io::HeaderMode::Compatible);
	anemo::Result res = writer.open();
	if (!res.ok()) {
		ANEMO_LOGF("main", res.msg);
		logger.shutdown();
		return 1;
	}
	std::unique_ptr< io::StatsLog > stats_log;
	if (params.save_statistics) {
		stats_log = std::make_unique< io::StatsLog >(stats_path);
		res = stats_log->open();
		if (!res.ok()) {
			ANEMO_LOGF("main", res.msg);
			logger.shutdown();
			return 1;
		}
	}
	ANEMO_LOGI("main", "data log " + data_path);
	if (stats_log)
		ANEMO_LOGI("main", "stats log " + stats_path);

	stats::StatisticsEngine engine(params.stats_window);
	stats::SampleBuffer buffer(params.record_capacity, params.series_capacity);
	app::Checkpointer checkpointer(engine, stats_log.get(),
								   params.checkpoint_every_points,
								   params.checkpoint_interval_ms, clock);

	app::IngestionLoop loop(ctx, *link,
							app::Pipeline{schema, writer, engine, buffer,
										  checkpointer});
	loop.connect();

	display::TextDisplay text(std::cout);
	display::DisplayRunner runner(text, engine, buffer, loop, clock);
	runner.setFiles(anemo::core::base_of(data_path),
					stats_log ? anemo::core::base_of(stats_path) : std::string());
	runner.setShowRaw(params.show_raw);
	// the live view owns the terminal from here on
	logger.flush();
	logger.setConsoleEnabled(app::consoleWhileStreaming(quiet, !no_display));
	if (!no_display)
		runner.start(params.display_refresh_ms);

	loop.run();
	runner.stop();
	logger.flush();
	logger.setConsoleEnabled(app::consoleAtStartup(quiet));

	const app::SessionSummary s = loop.summary();
	char rate[32];
	std::snprintf(rate, sizeof(rate), "%.1f", s.average_rate_hz);
	std::cout << "\nSession summary\n"
			  << "  Total points: " << s.points << "\n"
			  << "  Runtime:      " << anemo::core::Time::formatDuration(s.runtime_us)
			  << "\n"
			  << "  Average rate: " << rate << " Hz\n"
			  << "  Parameters:   " << s.parameters << "\n"
			  << "  Data log:     " << data_path << "\n";
	if (stats_log)
		std::cout << "  Stats log:    " << stats_path << "\n";

	const anemo::Errc code = loop.lastError().code;
	const bool failed = code != anemo::Errc::Ok && code != anemo::Errc::Closed;
	ANEMO_LOGI("main", failed ? "shutdown after error" : "shutdown complete");
	logger.shutdown();
	return failed ? 1 : 0;
}

#pragma once

#include <cstddef>
#include <stdint.h>

namespace cfg {
// clang-format off

//------------------------------------------------------------------------------
// Device / transport defaults
//------------------------------------------------------------------------------

static constexpr int DEFAULT_BAUD                 = 115200;
static constexpr int READ_TIMEOUT_MS              = 1000;
static constexpr size_t MAX_LINE_BYTES            = 1024;
static constexpr size_t SERIAL_READ_BUF_SIZE      = 256;

//------------------------------------------------------------------------------
// Output files
//------------------------------------------------------------------------------

static constexpr const char* DEFAULT_LOG_DIR      = "./OUTPUT";
static constexpr const char* DATA_FILE_PREFIX     = "TrisonicaData_";
static constexpr const char* STATS_FILE_PREFIX    = "TrisonicaStats_";
static constexpr const char* DIAG_LOG_NAME        = "anemolog.log";
static constexpr const char* STATS_HEADER         =
	"timestamp,parameter,min,max,mean,std_dev,count";
static constexpr const char* TIMESTAMP_COLUMN     = "timestamp";

//------------------------------------------------------------------------------
// Statistics window (K)
//------------------------------------------------------------------------------

static constexpr size_t STATS_WINDOW_MIN          = 100;
static constexpr size_t STATS_WINDOW_MAX          = 200;
static constexpr size_t STATS_WINDOW_DEFAULT      = 150;

//------------------------------------------------------------------------------
// Display
//------------------------------------------------------------------------------

static constexpr size_t RAW_LINES_SHOWN           = 8;
static constexpr size_t SPARKLINE_WIDTH           = 40;

// quality ranges
static constexpr double SPEED_GOOD_MIN            = 0.0;
static constexpr double SPEED_GOOD_MAX            = 50.0;   // m/s
static constexpr double TEMP_GOOD_MIN             = -40.0;
static constexpr double TEMP_GOOD_MAX             = 60.0;   // degC

// clang-format on
} // namespace cfg

#pragma once

namespace app {

// Diagnostics reach the terminal until the live view takes it over, so
// startup failures are always visible unless --quiet.
inline bool consoleAtStartup(bool quiet) { return !quiet; }
inline bool consoleWhileStreaming(bool quiet, bool display) {
	return !quiet && !display;
}

} // namespace app

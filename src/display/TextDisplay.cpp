#include "display/TextDisplay.h"

#include "config/Config.h"
#include "display/Quality.h"

#include <anemo/core/Time.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace display {

namespace {

std::string colorQuality(Quality q, bool ansi) {
	const char *name = qualityName(q);
	if (!ansi)
		return name;
	switch (q) {
	case Quality::Good:
		return std::string("\x1b[32m") + name + "\x1b[0m";
	case Quality::CheckRange:
		return std::string("\x1b[33m") + name + "\x1b[0m";
	case Quality::Invalid:
		return std::string("\x1b[31m") + name + "\x1b[0m";
	case Quality::Unknown:
		break;
	}
	return name;
}

std::string fixed3(double v) {
	char buf[32];
	std::snprintf(buf, sizeof(buf), "%.3f", v);
	return buf;
}

std::string pad(const std::string &s, size_t width) {
	if (s.size() >= width)
		return s.substr(0, width);
	return s + std::string(width - s.size(), ' ');
}

} // namespace

std::string sparkline(const std::vector< double > &vals, size_t width) {
	static const char *k = " .:-=+*#@";
	const size_t levels = 8;
	std::string out;
	out.reserve(width);
	if (vals.empty()) {
		out.assign(width, ' ');
		return out;
	}
	const size_t start = (vals.size() > width) ? (vals.size() - width) : 0;
	const size_t pad_n = (vals.size() < width) ? (width - vals.size()) : 0;
	const auto mm = std::minmax_element(vals.begin() + (long)start, vals.end());
	const double min_v = *mm.first;
	const double denom = *mm.second - min_v;
	out.assign(pad_n, ' ');
	for (size_t i = start; i < vals.size(); ++i) {
		double n = (denom <= 0.0) ? 0.5 : (vals[i] - min_v) / denom;
		n = std::clamp(n, 0.0, 1.0);
		const size_t idx = (size_t)std::lround(n * (double)levels);
		out.push_back(k[idx]);
	}
	return out;
}

TextDisplay::TextDisplay(std::ostream &out, bool ansi)
	: out_(out), ansi_(ansi) {}

std::string TextDisplay::format(const DisplaySnapshot &snap) const {
	std::ostringstream os;
	char rate[32];
	std::snprintf(rate, sizeof(rate), "%.1f", snap.rate_hz);

	os << "anemolog  runtime " << anemo::core::Time::formatDuration(snap.runtime_us)
	   << "  points " << snap.points << "  rate " << rate << " Hz\n";
	os << "data  " << snap.data_file << "\n";
	if (!snap.stats_file.empty())
		os << "stats " << snap.stats_file << "\n";
	os << "\n";

	if (snap.recent.empty()) {
		os << "Waiting for data...\n";
	} else {
		const ingest::Record &latest = snap.recent.back();
		os << pad("Parameter", 12) << pad("Value", 12) << pad("Unit", 8)
		   << "Quality\n";
		for (const auto &f : latest.fields) {
			os << pad(f.first, 12) << pad(f.second, 12)
			   << pad(unitFor(f.first), 8)
			   << colorQuality(assessQuality(f.first, f.second), ansi_) << "\n";
		}
	}
	os << "\n";

	if (!snap.stats.empty()) {
		os << pad("Parameter", 12) << pad("Current", 11) << pad("Min", 11)
		   << pad("Max", 11) << pad("Mean", 11) << pad("Std Dev", 11)
		   << "Count\n";
		for (const auto &s : snap.stats) {
			os << pad(s.name, 12) << pad(fixed3(s.last), 11)
			   << pad(fixed3(s.min), 11) << pad(fixed3(s.max), 11)
			   << pad(fixed3(s.mean), 11) << pad(fixed3(s.std_dev), 11)
			   << s.count << "\n";
		}
		os << "\n";
	}

	for (size_t c = 0; c < stats::CATEGORY_COUNT; ++c) {
		os << pad(stats::categoryName((stats::Category)c), 16) << "|"
		   << sparkline(snap.series[c], cfg::SPARKLINE_WIDTH) << "|\n";
	}

	if (snap.show_raw) {
		os << "\n";
		const size_t n = std::min(snap.recent.size(), cfg::RAW_LINES_SHOWN);
		for (size_t i = snap.recent.size() - n; i < snap.recent.size(); ++i) {
			const std::string ts =
				anemo::core::Time::formatIso(snap.recent[i].ts_us);
			// HH:MM:SS.mmm
			os << ts.substr(11, 12) << ": " << snap.recent[i].raw_line << "\n";
		}
	}
	return os.str();
}

void TextDisplay::render(const DisplaySnapshot &snap) {
	if (ansi_) {
		if (!started_)
			out_ << "\x1b[?25l"; // hide cursor
		out_ << "\x1b[H\x1b[2J";
	}
	started_ = true;
	out_ << format(snap) << std::flush;
}

void TextDisplay::finish() {
	if (ansi_ && started_)
		out_ << "\x1b[?25h" << std::flush;
}

} // namespace display

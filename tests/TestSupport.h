#pragma once

#include "app/SessionContext.h"
#include "transport/ILineTransport.h"

#include <anemo/core/Result.hpp>

#include <cstdint>
#include <cstdlib>
#include <deque>
#include <dirent.h>
#include <fstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testing {

class FakeClock final : public app::IClock {
public:
	uint64_t wallUs() const override { return wall_us; }
	uint64_t monoUs() const override { return mono_us; }
	void advanceMs(uint64_t ms) {
		wall_us += ms * 1000ULL;
		mono_us += ms * 1000ULL;
	}

	// 2024-05-01T12:00:00Z
	uint64_t wall_us = 1714564800ULL * 1000000ULL;
	uint64_t mono_us = 5000000ULL;
};

/** Hands out scripted lines; every readLine() advances the clock by
 * step_ms. After the script: Closed, or Timeout forever when
 * timeout_when_empty is set. */
class ScriptedTransport final : public transport::ILineTransport {
public:
	explicit ScriptedTransport(FakeClock *clock = nullptr, uint64_t step_ms = 100)
		: clock_(clock), step_ms_(step_ms) {}

	void line(std::string l) { script_.push_back(Item{anemo::Result::Ok(), std::move(l)}); }
	void timeout() {
		script_.push_back(Item{anemo::Result::Fail(anemo::Errc::Timeout, ""), ""});
	}
	void fail(anemo::Errc code, std::string msg) {
		script_.push_back(Item{anemo::Result::Fail(code, std::move(msg)), ""});
	}

	anemo::Result readLine(int, std::string &out) override {
		++reads;
		if (clock_)
			clock_->advanceMs(step_ms_);
		out.clear();
		if (closed)
			return anemo::Result::Fail(anemo::Errc::Closed, "closed");
		if (script_.empty()) {
			if (timeout_when_empty)
				return anemo::Result::Fail(anemo::Errc::Timeout, "");
			return anemo::Result::Fail(anemo::Errc::Closed, "end of script");
		}
		Item it = script_.front();
		script_.pop_front();
		out = it.text;
		return it.res;
	}
	void close() override { closed = true; }
	std::string describe() const override { return "script"; }

	bool timeout_when_empty = false;
	bool closed = false;
	int reads = 0;

private:
	struct Item {
		anemo::Result res;
		std::string text;
	};
	FakeClock *clock_;
	uint64_t step_ms_;
	std::deque< Item > script_;
};

class TempDir {
public:
	TempDir() {
		char tmpl[] = "/tmp/anemolog_test_XXXXXX";
		const char *p = mkdtemp(tmpl);
		path_ = p ? p : "/tmp";
	}
	~TempDir() {
		DIR *d = opendir(path_.c_str());
		if (!d)
			return;
		while (dirent *e = readdir(d)) {
			const std::string name = e->d_name;
			if (name == "." || name == "..")
				continue;
			::unlink((path_ + "/" + name).c_str());
		}
		closedir(d);
		::rmdir(path_.c_str());
	}
	std::string file(const std::string &name) const { return path_ + "/" + name; }
	const std::string &path() const { return path_; }

private:
	std::string path_;
};

inline std::vector< std::string > readLines(const std::string &path) {
	std::vector< std::string > out;
	std::ifstream in(path);
	std::string line;
	while (std::getline(in, line))
		out.push_back(line);
	return out;
}

inline std::vector< std::string > splitCsv(const std::string &line) {
	std::vector< std::string > out;
	size_t start = 0;
	while (true) {
		const size_t comma = line.find(',', start);
		if (comma == std::string::npos) {
			out.push_back(line.substr(start));
			return out;
		}
		out.push_back(line.substr(start, comma - start));
		start = comma + 1;
	}
}

} // namespace testing

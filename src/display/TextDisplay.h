#pragma once

#include "display/IDisplay.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace display {

/** Full-screen ANSI text view: status line, latest measurements with
 * quality, statistics table, sparklines of the category series and
 * optionally the raw stream. */
class TextDisplay final : public IDisplay {
public:
	explicit TextDisplay(std::ostream &out, bool ansi = true);

	void render(const DisplaySnapshot &snap) override;
	void finish() override;

	std::string format(const DisplaySnapshot &snap) const;

private:
	std::ostream &out_;
	bool ansi_;
	bool started_ = false;
};

std::string sparkline(const std::vector< double > &vals, size_t width);

} // namespace display

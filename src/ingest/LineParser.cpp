#include "ingest/LineParser.h"

#include <cctype>
#include <sstream>
#include <vector>

namespace ingest {

static bool isSpace(char c) { return std::isspace((unsigned char)c) != 0; }

std::string trim(const std::string &s) {
	size_t start = 0;
	while (start < s.size() && isSpace(s[start]))
		++start;
	size_t end = s.size();
	while (end > start && isSpace(s[end - 1]))
		--end;
	return s.substr(start, end - start);
}

static void parseSegment(const std::string &raw, FieldMap &out) {
	const std::string seg = trim(raw);
	const size_t sp = seg.find(' ');
	if (sp == std::string::npos)
		return;
	std::string name = trim(seg.substr(0, sp));
	std::string value = trim(seg.substr(sp + 1));
	if (name.empty() || value.empty())
		return;
	out.set(std::move(name), std::move(value));
}

FieldMap LineParser::parse(const std::string &line) const {
	FieldMap out;
	const std::string s = trim(line);
	if (s.empty())
		return out;

	if (s.find(',') != std::string::npos) {
		size_t start = 0;
		while (start <= s.size()) {
			size_t comma = s.find(',', start);
			if (comma == std::string::npos)
				comma = s.size();
			parseSegment(s.substr(start, comma - start), out);
			start = comma + 1;
		}
		return out;
	}

	std::vector< std::string > tokens;
	std::istringstream iss(s);
	std::string tok;
	while (iss >> tok)
		tokens.push_back(tok);
	for (size_t i = 0; i + 1 < tokens.size(); i += 2)
		out.set(tokens[i], tokens[i + 1]);
	return out;
}

} // namespace ingest

#pragma once

#include "ingest/Record.h"

#include <string>

namespace ingest {

/** Extracts name/value pairs from one anemometer line.
 *
 *   "S 5.0, T 20.0, D 270"  comma separated "name value" segments
 *   "S 5.0 T 20.0 D 270"    whitespace separated, paired consecutively
 *
 * Never fails. Segments that do not yield a non-empty name and value are
 * skipped, as is a trailing unpaired token. */
class LineParser {
public:
	FieldMap parse(const std::string &line) const;
};

std::string trim(const std::string &s);

} // namespace ingest

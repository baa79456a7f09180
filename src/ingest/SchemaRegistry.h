#pragma once

#include "ingest/Record.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace ingest {

// Append-only column list; "timestamp" is always column 0.
class SchemaRegistry {
public:
	SchemaRegistry();

	// Appends unseen names in first-seen order. True if anything was added.
	bool observe(const FieldMap &fields);

	const std::vector< std::string > &header() const { return columns_; }
	size_t size() const { return columns_.size(); }
	bool contains(const std::string &name) const;

private:
	std::vector< std::string > columns_;
	std::unordered_set< std::string > known_;
};

} // namespace ingest

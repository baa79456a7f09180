#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ingest {

// Insertion-ordered name -> raw value mapping.
class FieldMap {
public:
	using Entry = std::pair< std::string, std::string >;
	using const_iterator = std::vector< Entry >::const_iterator;

	// Overwrites the value of an existing name in place.
	void set(std::string name, std::string value);
	const std::string *find(const std::string &name) const;

	size_t size() const { return entries_.size(); }
	bool empty() const { return entries_.empty(); }
	const_iterator begin() const { return entries_.begin(); }
	const_iterator end() const { return entries_.end(); }

private:
	std::vector< Entry > entries_;
};

inline void FieldMap::set(std::string name, std::string value) {
	for (auto &e : entries_) {
		if (e.first == name) {
			e.second = std::move(value);
			return;
		}
	}
	entries_.emplace_back(std::move(name), std::move(value));
}

inline const std::string *FieldMap::find(const std::string &name) const {
	for (const auto &e : entries_) {
		if (e.first == name)
			return &e.second;
	}
	return nullptr;
}

struct Record {
	uint64_t ts_us{}; // wall clock
	std::string raw_line;
	FieldMap fields;
};

} // namespace ingest

#pragma once

#include "ingest/Record.h"
#include "stats/RingBuffer.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stats {

enum class Category : uint8_t { WindSpeed = 0, Temperature, WindDirection };

static constexpr size_t CATEGORY_COUNT = 3;

const char *categoryName(Category c);

// Fixed table: "S" or "S<digits>" is wind speed, "T" temperature, "D"
// direction.
std::optional< Category > classify(const std::string &parameter);

/** Recent records and per-category series for the live view. Every
 * collection is bounded; the oldest entries go first. Thread-safe,
 * readers get copies. */
class SampleBuffer {
public:
	SampleBuffer(size_t record_capacity, size_t series_capacity);

	void push(const ingest::Record &r);

	std::optional< ingest::Record > latest() const;
	// Oldest first, at most n.
	std::vector< ingest::Record > recent(size_t n) const;
	std::vector< double > series(Category c) const;
	std::vector< uint64_t > timestamps() const;

	size_t size() const;
	size_t recordCapacity() const { return records_.capacity(); }
	size_t seriesCapacity() const { return timestamps_.capacity(); }

private:
	RingBuffer< double > &series_(Category c) { return series_arr_[(size_t)c]; }

	mutable std::mutex mtx_;
	RingBuffer< ingest::Record > records_;
	std::vector< RingBuffer< double > > series_arr_;
	RingBuffer< uint64_t > timestamps_;
};

} // namespace stats

#pragma once

#include "stats/RingBuffer.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stats {

struct ParameterSummary {
	std::string name;
	double min{};
	double max{};
	double mean{};    // over the window
	double std_dev{}; // population form, over the window
	double last{};
	uint64_t count{}; // all-time
};

/** Per-parameter windowed statistics.
 *
 * min/max/count cover the whole session, mean/std_dev only the most recent
 * window_capacity values. Parameters are created on their first numeric
 * value and kept until the engine is destroyed. All public methods are
 * thread-safe; readers get copies. */
class StatisticsEngine {
public:
	explicit StatisticsEngine(size_t window_capacity);

	// False (and no state change) when raw_value is not numeric.
	bool update(const std::string &parameter, const std::string &raw_value);
	void updateValue(const std::string &parameter, double value);

	// First-seen order.
	std::vector< ParameterSummary > snapshot() const;
	bool find(const std::string &parameter, ParameterSummary &out) const;
	std::vector< double > window(const std::string &parameter) const;

	size_t parameterCount() const;
	size_t windowCapacity() const { return window_capacity_; }

private:
	struct Entry {
		ParameterSummary summary;
		RingBuffer< double > window;

		explicit Entry(size_t cap) : window(cap) {}
	};

	void recompute_(Entry &e);

	size_t window_capacity_;
	mutable std::mutex mtx_;
	std::vector< Entry > entries_;
	std::unordered_map< std::string, size_t > index_;
};

} // namespace stats

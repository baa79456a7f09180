#include "stats/StatisticsEngine.h"

#include "stats/Numeric.h"

#include <algorithm>
#include <cmath>

namespace stats {

StatisticsEngine::StatisticsEngine(size_t window_capacity)
	: window_capacity_(window_capacity == 0 ? 1 : window_capacity) {}

bool StatisticsEngine::update(const std::string &parameter,
							  const std::string &raw_value) {
	double v = 0.0;
	if (!parseNumber(raw_value, v))
		return false;
	updateValue(parameter, v);
	return true;
}

void StatisticsEngine::updateValue(const std::string &parameter, double value) {
	std::lock_guard< std::mutex > lk(mtx_);
	auto it = index_.find(parameter);
	if (it == index_.end()) {
		index_.emplace(parameter, entries_.size());
		entries_.emplace_back(window_capacity_);
		Entry &e = entries_.back();
		e.summary.name = parameter;
		e.summary.min = e.summary.max = e.summary.mean = value;
		e.summary.std_dev = 0.0;
		e.summary.last = value;
		e.summary.count = 1;
		e.window.push(value);
		return;
	}

	Entry &e = entries_[it->second];
	e.summary.min = std::min(e.summary.min, value);
	e.summary.max = std::max(e.summary.max, value);
	e.summary.last = value;
	++e.summary.count;
	e.window.push(value);
	recompute_(e);
}

void StatisticsEngine::recompute_(Entry &e) {
	const size_t n = e.window.size();
	double sum = 0.0;
	for (size_t i = 0; i < n; ++i)
		sum += e.window[i];
	e.summary.mean = sum / (double)n;

	// std_dev keeps its previous value while the window holds one sample
	if (n > 1) {
		double sq = 0.0;
		for (size_t i = 0; i < n; ++i) {
			const double d = e.window[i] - e.summary.mean;
			sq += d * d;
		}
		e.summary.std_dev = std::sqrt(sq / (double)n);
	}
}

std::vector< ParameterSummary > StatisticsEngine::snapshot() const {
	std::lock_guard< std::mutex > lk(mtx_);
	std::vector< ParameterSummary > out;
	out.reserve(entries_.size());
	for (const auto &e : entries_)
		out.push_back(e.summary);
	return out;
}

bool StatisticsEngine::find(const std::string &parameter,
							ParameterSummary &out) const {
	std::lock_guard< std::mutex > lk(mtx_);
	auto it = index_.find(parameter);
	if (it == index_.end())
		return false;
	out = entries_[it->second].summary;
	return true;
}

std::vector< double > StatisticsEngine::window(const std::string &parameter) const {
	std::lock_guard< std::mutex > lk(mtx_);
	auto it = index_.find(parameter);
	if (it == index_.end())
		return {};
	return entries_[it->second].window.toVector();
}

size_t StatisticsEngine::parameterCount() const {
	std::lock_guard< std::mutex > lk(mtx_);
	return entries_.size();
}

} // namespace stats

#include "stats/SampleBuffer.h"

#include "stats/Numeric.h"

#include <cctype>

namespace stats {

const char *categoryName(Category c) {
	switch (c) {
	case Category::WindSpeed:
		return "wind_speed";
	case Category::Temperature:
		return "temperature";
	case Category::WindDirection:
		return "wind_direction";
	}
	return "unknown";
}

std::optional< Category > classify(const std::string &parameter) {
	if (parameter == "T")
		return Category::Temperature;
	if (parameter == "D")
		return Category::WindDirection;
	if (!parameter.empty() && parameter[0] == 'S') {
		for (size_t i = 1; i < parameter.size(); ++i) {
			if (!std::isdigit((unsigned char)parameter[i]))
				return std::nullopt;
		}
		return Category::WindSpeed;
	}
	return std::nullopt;
}

SampleBuffer::SampleBuffer(size_t record_capacity, size_t series_capacity)
	: records_(record_capacity), timestamps_(series_capacity) {
	series_arr_.reserve(CATEGORY_COUNT);
	for (size_t i = 0; i < CATEGORY_COUNT; ++i)
		series_arr_.emplace_back(series_capacity);
}

void SampleBuffer::push(const ingest::Record &r) {
	std::lock_guard< std::mutex > lk(mtx_);
	records_.push(r);
	for (const auto &f : r.fields) {
		const auto cat = classify(f.first);
		if (!cat)
			continue;
		double v = 0.0;
		if (parseNumber(f.second, v))
			series_(*cat).push(v);
	}
	timestamps_.push(r.ts_us);
}

std::optional< ingest::Record > SampleBuffer::latest() const {
	std::lock_guard< std::mutex > lk(mtx_);
	if (records_.empty())
		return std::nullopt;
	return records_.back();
}

std::vector< ingest::Record > SampleBuffer::recent(size_t n) const {
	std::lock_guard< std::mutex > lk(mtx_);
	if (n == 0)
		return {};
	return records_.toVector(n);
}

std::vector< double > SampleBuffer::series(Category c) const {
	std::lock_guard< std::mutex > lk(mtx_);
	return series_arr_[(size_t)c].toVector();
}

std::vector< uint64_t > SampleBuffer::timestamps() const {
	std::lock_guard< std::mutex > lk(mtx_);
	return timestamps_.toVector();
}

size_t SampleBuffer::size() const {
	std::lock_guard< std::mutex > lk(mtx_);
	return records_.size();
}

} // namespace stats

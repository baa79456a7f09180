#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace stats {

/** Fixed-capacity FIFO. push() on a full buffer evicts the oldest element.
 * Index 0 is the oldest element, size()-1 the newest. */
template < typename T > class RingBuffer {
public:
	explicit RingBuffer(size_t capacity)
		: slots_(capacity == 0 ? 1 : capacity) {}

	// Returns true when an element was evicted to make room.
	bool push(T v) {
		bool evicted = false;
		if (count_ == slots_.size()) {
			evict();
			evicted = true;
		}
		slots_[(head_ + count_) % slots_.size()] = std::move(v);
		++count_;
		return evicted;
	}

	// Drops the oldest element. No-op when empty.
	void evict() {
		if (count_ == 0)
			return;
		slots_[head_] = T{};
		head_ = (head_ + 1) % slots_.size();
		--count_;
	}

	void clear() {
		while (count_ > 0)
			evict();
		head_ = 0;
	}

	const T &operator[](size_t i) const {
		return slots_[(head_ + i) % slots_.size()];
	}
	const T &front() const { return (*this)[0]; }
	const T &back() const { return (*this)[count_ - 1]; }

	size_t size() const { return count_; }
	size_t capacity() const { return slots_.size(); }
	bool empty() const { return count_ == 0; }
	bool full() const { return count_ == slots_.size(); }

	// Oldest first. n == 0 or n > size() returns everything.
	std::vector< T > toVector(size_t n = 0) const {
		if (n == 0 || n > count_)
			n = count_;
		std::vector< T > out;
		out.reserve(n);
		for (size_t i = count_ - n; i < count_; ++i)
			out.push_back((*this)[i]);
		return out;
	}

private:
	std::vector< T > slots_;
	size_t head_ = 0;
	size_t count_ = 0;
};

} // namespace stats

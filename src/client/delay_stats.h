#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace SalKafka {

/**
 * Streaming summary of per-message delays (receive stamp minus send stamp),
 * in seconds. Constant memory regardless of how many samples are added.
 */
class DelayStats {
public:
	struct Summary {
		size_t count = 0;
		double mean = 0.0;
		// Population standard deviation
		double stdev = 0.0;
		double min = 0.0;
		double max = 0.0;
	};

	void Add(double delay) {
		++count_;
		// Welford's update
		const double delta = delay - mean_;
		mean_ += delta / static_cast<double>(count_);
		m2_ += delta * (delay - mean_);
		min_ = std::min(min_, delay);
		max_ = std::max(max_, delay);
	}

	size_t count() const { return count_; }

	Summary GetSummary() const {
		Summary s{};
		if (count_ == 0) {
			return s;
		}
		s.count = count_;
		s.mean = mean_;
		s.stdev = std::sqrt(m2_ / static_cast<double>(count_));
		s.min = min_;
		s.max = max_;
		return s;
	}

private:
	size_t count_ = 0;
	double mean_ = 0.0;
	double m2_ = 0.0;
	double min_ = std::numeric_limits<double>::infinity();
	double max_ = -std::numeric_limits<double>::infinity();
};

} // namespace SalKafka

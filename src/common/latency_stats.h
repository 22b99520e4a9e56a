#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

namespace Sluice {

// Nearest-rank percentile summary over per-request latencies.
class LatencyStats {
public:
	struct Summary {
		double min_us = 0.0;
		double average_us = 0.0;
		double p50_us = 0.0;
		double p90_us = 0.0;
		double p99_us = 0.0;
		double max_us = 0.0;
		size_t count = 0;

		std::string ToString() const {
			std::ostringstream out;
			out << "count=" << count
				<< " min=" << min_us / 1000.0 << "ms"
				<< " avg=" << average_us / 1000.0 << "ms"
				<< " p50=" << p50_us / 1000.0 << "ms"
				<< " p90=" << p90_us / 1000.0 << "ms"
				<< " p99=" << p99_us / 1000.0 << "ms"
				<< " max=" << max_us / 1000.0 << "ms";
			return out.str();
		}
	};

	void Add(std::chrono::nanoseconds latency) {
		samples_us_.push_back(
			std::chrono::duration_cast<std::chrono::microseconds>(latency).count());
	}

	size_t Count() const { return samples_us_.size(); }

	Summary Summarize() const { return ComputeSummary(samples_us_); }

	// Input order does not matter; a sorted copy is taken.
	static Summary ComputeSummary(std::vector<long long> latencies_us) {
		Summary s{};
		if (latencies_us.empty()) {
			return s;
		}
		std::sort(latencies_us.begin(), latencies_us.end());

		s.count = latencies_us.size();
		s.min_us = static_cast<double>(latencies_us.front());
		s.max_us = static_cast<double>(latencies_us.back());
		const long double sum = std::accumulate(
			latencies_us.begin(), latencies_us.end(), static_cast<long double>(0.0L));
		s.average_us = static_cast<double>(sum / static_cast<long double>(s.count));

		auto percentile = [&](double p) -> double {
			const double rank = std::ceil(p * static_cast<double>(s.count));
			size_t idx = (rank <= 1.0) ? 0 : static_cast<size_t>(rank - 1.0);
			if (idx >= s.count) idx = s.count - 1;
			return static_cast<double>(latencies_us[idx]);
		};

		s.p50_us = percentile(0.50);
		s.p90_us = percentile(0.90);
		s.p99_us = percentile(0.99);
		return s;
	}

private:
	std::vector<long long> samples_us_;
};

} // namespace Sluice

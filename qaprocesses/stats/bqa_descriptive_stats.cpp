#include "bqa_descriptive_stats.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace bqa {

double round_to(double value, int decimals) {
  double factor = std::pow(10.0, decimals);
  return std::nearbyint(value * factor) / factor;
}

namespace {

  double median_of(std::vector<double> sorted) {
    std::sort(sorted.begin(), sorted.end());
    size_t n = sorted.size();
    if (n % 2 == 1) {
      return sorted[n / 2];
    }
    return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
  }

  // std::map iterates keys in ascending order, so the strict '>' keeps the
  // smallest value among equally frequent ones.
  double mode_of(const std::vector<double>& values) {
    std::map<double, size_t> frequencies;
    for (double v : values) {
      ++frequencies[v];
    }

    double best_value = frequencies.begin()->first;
    size_t best_count = 0;
    for (const auto& entry : frequencies) {
      if (entry.second > best_count) {
        best_value = entry.first;
        best_count = entry.second;
      }
    }
    return best_value;
  }

} // namespace

bqa_descriptive_stats bqa_descriptive_stats_calculator::compute(const std::vector<double>& values) {
  bqa_descriptive_stats stats;
  if (values.empty()) {
    return stats;
  }

  const size_t n = values.size();
  const double raw_mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);

  stats.count = n;
  stats.mean = round_to(raw_mean, 2);
  stats.median = round_to(median_of(values), 2);
  stats.mode = mode_of(values);

  auto minmax = std::minmax_element(values.begin(), values.end());
  stats.min = *minmax.first;
  stats.max = *minmax.second;
  stats.range = round_to(stats.max - stats.min, 2);

  double raw_variance = 0.0;
  if (n > 1) {
    double sum_sq = 0.0;
    for (double v : values) {
      sum_sq += (v - raw_mean) * (v - raw_mean);
    }
    raw_variance = sum_sq / static_cast<double>(n - 1);
  }
  stats.variance = round_to(raw_variance, 2);
  stats.std_dev = round_to(std::sqrt(raw_variance), 2);

  if (stats.std_dev != 0.0) {
    stats.skewness = round_to(3.0 * (stats.mean - stats.median) / stats.std_dev, 2);

    double fourth_moment = 0.0;
    for (double v : values) {
      fourth_moment += std::pow(v - stats.mean, 4);
    }
    fourth_moment /= static_cast<double>(n);
    stats.kurtosis = round_to(fourth_moment / std::pow(stats.std_dev, 4) - 3.0, 2);
  }

  return stats;
}

} // namespace bqa

#ifndef BQA_DESCRIPTIVE_STATS_H
#define BQA_DESCRIPTIVE_STATS_H

#include <cstddef>
#include <optional>
#include <vector>

namespace bqa {

struct bqa_descriptive_stats {
  size_t count = 0;
  double mean = 0.0;               // rounded to 2 decimals
  double median = 0.0;             // rounded to 2 decimals
  std::optional<double> mode;      // null for empty input
  double min = 0.0;
  double max = 0.0;
  double range = 0.0;
  double variance = 0.0;           // sample variance (n-1), rounded
  double std_dev = 0.0;            // sample standard deviation (n-1), rounded
  double skewness = 0.0;           // Pearson's second coefficient, rounded
  double kurtosis = 0.0;           // excess kurtosis, rounded
};

/**
 * @brief Summary statistics over a numeric sequence.
 *
 * Empty input yields count 0, mode null and every other field 0.
 * A single value yields variance and std_dev 0 (sample variance is undefined
 * for n = 1). Skewness and kurtosis are derived from the already rounded
 * mean, median and std_dev and are 0 when std_dev is 0.
 * Ties for the mode go to the smallest value.
 */
class bqa_descriptive_stats_calculator {
public:
  static bqa_descriptive_stats compute(const std::vector<double>& values);
};

// Rounds to the given number of decimals, sending exact halves to the even digit.
double round_to(double value, int decimals);

} // namespace bqa

#endif // BQA_DESCRIPTIVE_STATS_H

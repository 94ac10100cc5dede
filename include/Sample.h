#pragma once

#include <cstddef>
#include <iostream>
#include <string>

namespace AIF {

/**
 * @brief Running count, mean, spread and extremes of a stream of samples,
 * accumulated with Welford's online algorithm.
 */
class RunningStats {
 private:
  size_t _count = 0;
  double _mean = 0.0;
  double _sq_dev = 0.0;  // sum of squared deviations from the mean
  double _min;
  double _max;

 public:
  RunningStats();

  void Add(double x);

  size_t Count() const { return _count; }
  double Mean() const { return _mean; }
  /// Sample variance, 0 below two samples
  double Variance() const;
  double StdDev() const;
  double Min() const { return _min; }
  double Max() const { return _max; }
};

/// @brief Write count, mean, extremes and standard deviation of `stats`,
/// labelled with the algorithm and the measured quantity
void PrintStats(const RunningStats& stats, const std::string& alg_name,
                const std::string& quantity, std::ostream& os = std::cout);

}  // namespace AIF

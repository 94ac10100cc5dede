#include "Sample.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace AIF {

RunningStats::RunningStats()
    : _min(std::numeric_limits<double>::infinity()),
      _max(-std::numeric_limits<double>::infinity()) {}

void RunningStats::Add(double x) {
  ++_count;
  const double delta = x - _mean;
  _mean += delta / _count;
  _sq_dev += delta * (x - _mean);
  _min = std::min(_min, x);
  _max = std::max(_max, x);
}

double RunningStats::Variance() const {
  return _count < 2 ? 0.0 : _sq_dev / (_count - 1);
}

double RunningStats::StdDev() const { return std::sqrt(Variance()); }

static std::string print_inf(double num) {
  if (std::isinf(num)) return num > 0 ? "inf" : "-inf";
  std::ostringstream stream;
  stream << std::fixed << num;
  return stream.str();
}

void PrintStats(const RunningStats& stats, const std::string& alg_name,
                const std::string& quantity, std::ostream& os) {
  os << alg_name << " Count: " << stats.Count() << std::endl;
  os << alg_name << " Average " << quantity << ": "
     << print_inf(stats.Mean()) << std::endl;
  os << alg_name << " Highest " << quantity << ": " << print_inf(stats.Max())
     << std::endl;
  os << alg_name << " Lowest " << quantity << ": " << print_inf(stats.Min())
     << std::endl;
  os << alg_name << " " << quantity
     << " std dev: " << print_inf(stats.StdDev()) << std::endl;
}

}  // namespace AIF

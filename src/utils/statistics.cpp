#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace Stats {

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double population_variance(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  double m = mean(values);
  double sum_sq = 0.0;
  for (double v : values)
    sum_sq += (v - m) * (v - m);
  return sum_sq / static_cast<double>(values.size());
}

double population_stddev(const std::vector<double> &values) {
  return std::sqrt(population_variance(values));
}

double pearson(const std::vector<double> &x, const std::vector<double> &y) {
  if (x.size() != y.size() || x.empty())
    return 0.0;

  double mean_x = mean(x);
  double mean_y = mean(y);

  double numerator = 0.0;
  double sum_sq_x = 0.0;
  double sum_sq_y = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    double dx = x[i] - mean_x;
    double dy = y[i] - mean_y;
    numerator += dx * dy;
    sum_sq_x += dx * dx;
    sum_sq_y += dy * dy;
  }

  double denominator = std::sqrt(sum_sq_x * sum_sq_y);
  if (denominator == 0.0)
    return 0.0;
  return clamp_finite(numerator / denominator, -1.0, 1.0);
}

double euclidean_distance(const std::vector<double> &a,
                          const std::vector<double> &b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    double diff = a[i] - b[i];
    sum += diff * diff;
  }
  return std::sqrt(sum);
}

double clamp_finite(double value, double low, double high) {
  if (std::isnan(value))
    return low;
  return std::clamp(value, low, high);
}

size_t argmax(const std::vector<double> &values) {
  if (values.empty())
    return 0;
  return static_cast<size_t>(
      std::distance(values.begin(), std::max_element(values.begin(), values.end())));
}

size_t argmin(const std::vector<double> &values) {
  if (values.empty())
    return 0;
  return static_cast<size_t>(
      std::distance(values.begin(), std::min_element(values.begin(), values.end())));
}

} // namespace Stats

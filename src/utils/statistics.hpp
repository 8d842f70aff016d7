#ifndef STATISTICS_HPP
#define STATISTICS_HPP

#include <cstddef>
#include <vector>

namespace Stats {

// All helpers return 0 for empty input instead of NaN.
double mean(const std::vector<double> &values);
double population_variance(const std::vector<double> &values);
double population_stddev(const std::vector<double> &values);

// Pearson coefficient of two equally sized series, clamped to [-1, 1].
// 0 when either series has no variance or the sizes differ.
double pearson(const std::vector<double> &x, const std::vector<double> &y);

double euclidean_distance(const std::vector<double> &a,
                          const std::vector<double> &b);

// Clamp that also maps NaN to `low`.
double clamp_finite(double value, double low, double high);

// Index of the first maximum / minimum, 0 for empty input.
size_t argmax(const std::vector<double> &values);
size_t argmin(const std::vector<double> &values);

} // namespace Stats

#endif // STATISTICS_HPP

#ifndef FQBENCH_TIMINGSTATS_HPP
#define FQBENCH_TIMINGSTATS_HPP
/**
 * @file TimingStats.hpp
 * @brief Wall-clock summaries for tool trials (median, p10/p90, min/max, mean, stddev, CV).
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace fqbench {
namespace harness {

/* ------------------------------- Stats --------------------------------- */

/** @brief Summary of per-run wall times (seconds). */
struct Stats {
  double median{};         ///< 50th percentile
  double p10{};            ///< 10th percentile
  double p90{};            ///< 90th percentile
  double min{};            ///< minimum
  double max{};            ///< maximum
  double mean{};           ///< arithmetic mean
  double stddev{};         ///< sample standard deviation (0 for a single run)
  double cv{};             ///< coefficient of variation (stddev/mean)
  std::size_t samples{};   ///< number of measured runs
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Compute summary statistics with linear interpolation for quantiles.
 * @param values Per-run wall times (modified: sorted in-place).
 * @return Stats summary; zero-initialized if empty.
 *
 * Standard deviation uses the sample (n-1) formula so that values match what the
 * hyperfine engine reports for the same runs.
 */
inline Stats summarize(std::vector<double>& values) {
  if (values.empty()) {
    return {};
  }
  std::sort(values.begin(), values.end());

  const auto QUANTILE = [&](double f) {
    const double IDX = f * static_cast<double>(values.size() - 1);
    const std::size_t LO = static_cast<std::size_t>(IDX);
    const std::size_t HI = (LO + 1 < values.size()) ? (LO + 1) : LO;
    const double FRAC = IDX - static_cast<double>(LO);
    return values[LO] * (1.0 - FRAC) + values[HI] * FRAC;
  };

  double sum = 0.0;
  for (const double VAL : values) {
    sum += VAL;
  }
  const double MEAN = sum / static_cast<double>(values.size());

  double stddev = 0.0;
  if (values.size() > 1) {
    double sumSquaredDiff = 0.0;
    for (const double VAL : values) {
      const double DIFF = VAL - MEAN;
      sumSquaredDiff += DIFF * DIFF;
    }
    stddev = std::sqrt(sumSquaredDiff / static_cast<double>(values.size() - 1));
  }

  const double CV = (MEAN != 0.0) ? (stddev / MEAN) : 0.0;

  Stats s;
  s.median = QUANTILE(0.50);
  s.p10 = QUANTILE(0.10);
  s.p90 = QUANTILE(0.90);
  s.min = values.front();
  s.max = values.back();
  s.mean = MEAN;
  s.stddev = stddev;
  s.cv = CV;
  s.samples = values.size();
  return s;
}

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_TIMINGSTATS_HPP

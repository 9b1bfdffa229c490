#ifndef WAYFINDER_STATS_HPP
#define WAYFINDER_STATS_HPP

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace wayfinder {

/**
 * @brief Percentile with linear interpolation between closest ranks.
 *
 * @param values  Sample (any order, copied).
 * @param q       Percentile in [0, 100].
 * @return        0 for an empty sample.
 */
inline double percentile(std::vector<double> values, double q)
{
    if (values.empty())
        return 0.0;
    std::sort(values.begin(), values.end());
    q = std::clamp(q, 0.0, 100.0);
    const double pos = q / 100.0 * static_cast<double>(values.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
    const std::size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

/** Summary statistics of one per-run quantity. */
struct Distribution
{
    double mean   = 0.0;
    double median = 0.0;
    double p10    = 0.0;
    double p90    = 0.0;
    double min    = 0.0;
    double max    = 0.0;
    double stddev = 0.0; ///< population standard deviation
};

inline Distribution summarize(const std::vector<double>& values)
{
    Distribution d;
    if (values.empty())
        return d;

    const double n = static_cast<double>(values.size());
    d.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    double sq = 0.0;
    for (double v : values)
        sq += (v - d.mean) * (v - d.mean);
    d.stddev = std::sqrt(sq / n);

    const auto mm = std::minmax_element(values.begin(), values.end());
    d.min    = *mm.first;
    d.max    = *mm.second;
    d.median = percentile(values, 50.0);
    d.p10    = percentile(values, 10.0);
    d.p90    = percentile(values, 90.0);
    return d;
}

} // namespace wayfinder

#endif // WAYFINDER_STATS_HPP

/**
 * Statistics Utilities - Implementation
 */

#include "stat_utils.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

#include <boost/math/distributions/students_t.hpp>

namespace genescore {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double total = std::accumulate(values.begin(), values.end(), 0.0);
    return total / values.size();
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t n = values.size();
    if (n % 2 == 1) return values[n / 2];
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double m = mean(values);
    double ss = 0.0;
    for (double v : values) {
        ss += (v - m) * (v - m);
    }
    return std::sqrt(ss / values.size());
}

std::optional<double> sample_stddev(const std::vector<double>& values) {
    if (values.size() < 2) return std::nullopt;
    double m = mean(values);
    double ss = 0.0;
    for (double v : values) {
        ss += (v - m) * (v - m);
    }
    return std::sqrt(ss / (values.size() - 1));
}

std::optional<double> percentile_linear(std::vector<double> values, double q) {
    if (values.empty()) return std::nullopt;
    std::sort(values.begin(), values.end());

    q = std::min(1.0, std::max(0.0, q));
    double pos = q * (values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(pos));
    size_t upper = static_cast<size_t>(std::ceil(pos));
    double frac = pos - lower;
    return values[lower] + (values[upper] - values[lower]) * frac;
}

double median_abs_deviation(const std::vector<double>& values, double scale) {
    if (values.empty()) return 0.0;
    double center = median(values);
    std::vector<double> deviations;
    deviations.reserve(values.size());
    for (double v : values) {
        deviations.push_back(std::fabs(v - center));
    }
    return median(std::move(deviations)) * scale;
}

std::vector<double> average_ranks(const std::vector<double>& values) {
    size_t n = values.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&values](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n, 0.0);
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && values[order[j + 1]] == values[order[i]]) j++;
        // Positions i..j (0-based) share rank mean((i+1)..(j+1))
        double rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
        for (size_t k = i; k <= j; ++k) {
            ranks[order[k]] = rank;
        }
        i = j + 1;
    }
    return ranks;
}

std::optional<double> pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    double mx = mean(x);
    double my = mean(y);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;

    double r = sxy / std::sqrt(sxx * syy);
    return std::min(1.0, std::max(-1.0, r));
}

std::optional<double> spearman_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) return std::nullopt;
    return pearson_correlation(average_ranks(x), average_ranks(y));
}

std::optional<double> correlation_p_value(double r, size_t n) {
    if (n < 3 || std::isnan(r) || r < -1.0 || r > 1.0) return std::nullopt;

    double remainder = 1.0 - r * r;
    if (remainder <= 0.0) return 0.0;

    double df = static_cast<double>(n - 2);
    double t = std::fabs(r) * std::sqrt(df / remainder);

    boost::math::students_t dist(df);
    double p = 2.0 * boost::math::cdf(boost::math::complement(dist, t));
    return std::min(1.0, p);
}

std::vector<double> percent_ranks(const std::vector<double>& values) {
    size_t n = values.size();
    std::vector<double> result(n, 0.0);
    if (n <= 1) return result;

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&values](size_t a, size_t b) { return values[a] < values[b]; });

    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && values[order[j + 1]] == values[order[i]]) j++;
        double pr = static_cast<double>(i) / (n - 1);
        for (size_t k = i; k <= j; ++k) {
            result[order[k]] = pr;
        }
        i = j + 1;
    }
    return result;
}

} // namespace genescore

#include "kcalfit/stats.h"

#include <cmath>

#include <Eigen/Dense>

namespace kcalfit {

namespace {

Eigen::Map<const Eigen::ArrayXd> view(const std::vector<double> &v) {
    return Eigen::Map<const Eigen::ArrayXd>(v.data(),
                                            static_cast<Eigen::Index>(v.size()));
}

}  // namespace

double mean(const std::vector<double> &xs) {
    if (xs.empty()) return 0.0;
    return view(xs).mean();
}

double sampleSD(const std::vector<double> &xs, double mean) {
    if (xs.size() < 2) return 0.0;
    const double sumSq = (view(xs) - mean).square().sum();
    return std::sqrt(sumSq / static_cast<double>(xs.size() - 1));
}

Interval confidenceInterval(double mean, double sd, int n, ConfidenceLevel level) {
    if (n < 2) return {mean, mean};
    const double margin = zScore(level) * sd / std::sqrt(static_cast<double>(n));
    return {mean - margin, mean + margin};
}

Regression linearRegression(const std::vector<double> &x,
                            const std::vector<double> &y) {
    Regression fit;
    const auto n = static_cast<Eigen::Index>(x.size());
    if (n < 2 || y.size() != x.size()) return fit;

    const auto X = view(x);
    const auto Y = view(y);
    const double xMean = X.mean();
    const double yMean = Y.mean();
    const double ssx = (X - xMean).square().sum();
    if (ssx == 0.0 || !std::isfinite(ssx)) return fit;

    fit.slope = ((X - xMean) * (Y - yMean)).sum() / ssx;
    fit.intercept = yMean - fit.slope * xMean;

    const double ssTot = (Y - yMean).square().sum();
    const double ssRes = (Y - (fit.slope * X + fit.intercept)).square().sum();
    fit.r2 = ssTot == 0.0 ? 0.0 : 1.0 - ssRes / ssTot;
    return fit;
}

double slopeStandardError(const std::vector<double> &x,
                          const std::vector<double> &y, const Regression &fit) {
    const auto n = static_cast<Eigen::Index>(x.size());
    if (n < 3 || y.size() != x.size()) return 0.0;

    const auto X = view(x);
    const auto Y = view(y);
    const double ssx = (X - X.mean()).square().sum();
    if (ssx == 0.0) return 0.0;

    const double mse = (Y - (fit.slope * X + fit.intercept)).square().sum() /
                       static_cast<double>(n - 2);
    return std::sqrt(mse / ssx);
}

}  // namespace kcalfit

#ifndef KCALFIT_STATS_H
#define KCALFIT_STATS_H

#include <vector>

#include "kcalfit/types.h"

namespace kcalfit {

struct Regression {
    double slope = 0.0;
    double intercept = 0.0;
    double r2 = 0.0;
};

double mean(const std::vector<double> &xs);

// Sample standard deviation (n-1); 0 when fewer than 2 values.
double sampleSD(const std::vector<double> &xs, double mean);

// mean +- z*sd/sqrt(n); collapses to [mean, mean] when n < 2.
Interval confidenceInterval(double mean, double sd, int n, ConfidenceLevel level);

// Ordinary least squares of y on x. Degenerate input (n < 2, constant x)
// gives the all-zero fit instead of NaN.
Regression linearRegression(const std::vector<double> &x,
                            const std::vector<double> &y);

// sqrt(MSE / SSx) with n-2 degrees of freedom; 0 when n < 3 or SSx == 0.
double slopeStandardError(const std::vector<double> &x,
                          const std::vector<double> &y, const Regression &fit);

}  // namespace kcalfit

#endif  // KCALFIT_STATS_H

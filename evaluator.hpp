#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "fare_model.hpp"
#include "trip_record.hpp"

namespace taxi_fare {

struct RegressionMetrics {
    double r_squared = 0.0;
    double rmse      = 0.0;   // root mean squared error
    double mse       = 0.0;
    double mae       = 0.0;
    size_t count     = 0;
};

/*  Standard definitions: R² = 1 - SS_res / SS_tot, RMSE = sqrt(SS_res / n).
    With constant labels (SS_tot == 0) R² is 1 for a perfect fit, else 0.
    An empty set gives NaN for every metric and count 0; mismatched
    lengths throw.                                                         */
RegressionMetrics compute_metrics(const Eigen::VectorXd& labels,
                                  const Eigen::VectorXd& scores);

RegressionMetrics evaluate(const FareModel& model, const std::vector<TripRecord>& trips);
RegressionMetrics evaluate(const FareModel& model, const std::string& test_path);

void print_metrics(const RegressionMetrics& m, std::ostream& out);

} // namespace taxi_fare

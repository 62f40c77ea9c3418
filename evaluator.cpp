#include <cmath>
#include <limits>
#include <stdexcept>

#include "common.hpp"
#include "evaluator.hpp"
#include "trip_loader.hpp"

namespace taxi_fare {

RegressionMetrics compute_metrics(const Eigen::VectorXd& labels,
                                  const Eigen::VectorXd& scores)
{
    if (labels.size() != scores.size())
        throw std::runtime_error("metrics: " + std::to_string(labels.size()) + " labels vs " +
                                 std::to_string(scores.size()) + " scores");
    if (labels.size() == 0) {
        logW("metrics: empty evaluation set, every metric is NaN");
        const double nan = std::numeric_limits<double>::quiet_NaN();
        RegressionMetrics m;
        m.r_squared = m.rmse = m.mse = m.mae = nan;
        m.count = 0;
        return m;
    }

    const double n = static_cast<double>(labels.size());
    const Eigen::VectorXd resid = labels - scores;

    const double ss_res = resid.squaredNorm();
    const double ss_tot = (labels.array() - labels.mean()).square().sum();

    RegressionMetrics m;
    m.count = static_cast<size_t>(labels.size());
    m.mse   = ss_res / n;
    m.rmse  = std::sqrt(m.mse);
    m.mae   = resid.cwiseAbs().sum() / n;

    if (ss_tot > 0.0) {
        m.r_squared = 1.0 - ss_res / ss_tot;
    } else {
        logW("labels are constant, R-squared is not defined; reporting " +
             std::string(ss_res == 0.0 ? "1" : "0"));
        m.r_squared = ss_res == 0.0 ? 1.0 : 0.0;
    }
    return m;
}

RegressionMetrics evaluate(const FareModel& model, const std::vector<TripRecord>& trips)
{
    const FeaturePipeline& pipe = model.pipeline();
    const Eigen::VectorXd scores = model.score_rows(pipe.encode_all(trips));
    return compute_metrics(pipe.labels(trips), scores);
}

RegressionMetrics evaluate(const FareModel& model, const std::string& test_path)
{
    const RegressionMetrics m = evaluate(model, load_trips(test_path));
    logI("Evaluated " + std::to_string(m.count) + " rows, MAE " + format_number(m.mae));
    return m;
}

void print_metrics(const RegressionMetrics& m, std::ostream& out)
{
    out << '\n'
        << "*************************************************\n"
        << "*       Model quality metrics evaluation         \n"
        << "*------------------------------------------------\n"
        << "*       RSquared Score:      "
        << format_optional_decimals(m.r_squared, 2, /*leading_zero=*/true) << '\n'
        << "*       Root Mean Squared Error:      "
        << format_optional_decimals(m.rmse, 2, /*leading_zero=*/false) << '\n';
}

} // namespace taxi_fare

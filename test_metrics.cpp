#include <cmath>
#include <iostream>
#include <sstream>

#include "common.hpp"
#include "evaluator.hpp"
#include "test_support.hpp"

using namespace taxi_fare;
using namespace taxi_fare::test;

static bool near(double a, double b, double eps = 1e-12) { return std::fabs(a - b) < eps; }

int main() {
    std::cout << "Testing regression metrics and number formatting..." << std::endl;
    Checker c;

    Eigen::VectorXd y(4), s(4);
    y << 1, 2, 3, 4;
    s << 1.5, 2, 2.5, 4;

    const RegressionMetrics m = compute_metrics(y, s);
    /* SS_res = 0.5, SS_tot = 5 */
    c.check(near(m.r_squared, 0.9), "R2 = 1 - SS_res/SS_tot");
    c.check(near(m.rmse, std::sqrt(0.125)), "RMSE = sqrt(SS_res/n)");
    c.check(near(m.mae, 0.25) && m.count == 4, "MAE and count");

    const RegressionMetrics perfect = compute_metrics(y, y);
    c.check(perfect.r_squared == 1.0 && perfect.rmse == 0.0, "perfect fit: R2 1, RMSE 0");

    Eigen::VectorXd bad(4);
    bad << 10, -3, 7, 0;
    const RegressionMetrics worse = compute_metrics(y, bad);
    c.check(worse.r_squared <= 1.0 && worse.r_squared < 0.0 && worse.rmse >= 0.0,
            "R2 <= 1, can go negative; RMSE non-negative");

    Eigen::VectorXd flat(2), flat_s(2);
    flat << 5, 5;
    flat_s << 4, 6;
    c.check(compute_metrics(flat, flat_s).r_squared == 0.0, "constant labels, imperfect: R2 0");
    c.check(compute_metrics(flat, flat).r_squared == 1.0, "constant labels, perfect: R2 1");

    const RegressionMetrics none = compute_metrics(Eigen::VectorXd(), Eigen::VectorXd());
    c.check(none.count == 0 && std::isnan(none.r_squared) && std::isnan(none.rmse) &&
            std::isnan(none.mse) && std::isnan(none.mae),
            "empty set reports NaN metrics and count 0");
    c.check_throws([&] { compute_metrics(y, flat); }, "length mismatch is rejected");

    /* ---------- "0.##" / "#.##" ---------- */
    c.check(format_optional_decimals(0.9, 2, true) == "0.9", "0.## drops trailing zero");
    c.check(format_optional_decimals(0.916, 2, true) == "0.92", "0.## rounds to 2 places");
    c.check(format_optional_decimals(1.0, 2, true) == "1", "0.## prints integers bare");
    c.check(format_optional_decimals(-0.25, 2, true) == "-0.25", "0.## keeps the sign");
    c.check(format_optional_decimals(0.5, 2, false) == ".5", "#.## omits the leading zero");
    c.check(format_optional_decimals(3.14159, 2, false) == "3.14", "#.## two places");
    c.check(format_optional_decimals(NAN, 2, true) == "NaN", "NaN text");

    std::ostringstream out;
    RegressionMetrics shown;
    shown.r_squared = 0.9123;
    shown.rmse      = 2.456;
    print_metrics(shown, out);
    c.check(out.str().find("*       RSquared Score:      0.91\n") != std::string::npos &&
            out.str().find("*       Root Mean Squared Error:      2.46\n") != std::string::npos,
            "banner prints both metrics");

    /* ---------- CSV numbers ---------- */
    c.check(format_number(2.5) == "2.5", "2.5 stays 2.5");
    c.check(format_number(100) == "100", "integral doubles print without exponent");
    c.check(format_number(0.1) == "0.1", "shortest text for 0.1");
    c.check(format_number(-17.125) == "-17.125", "negative value");
    const double odd = 12.345678901234567;
    c.check(std::stod(format_number(odd)) == odd, "text reads back to the same double");

    return c.failures();
}

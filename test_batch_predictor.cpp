#include <cmath>
#include <iostream>
#include <sstream>

#include "batch_predictor.hpp"
#include "common.hpp"
#include "evaluator.hpp"
#include "test_support.hpp"

using namespace taxi_fare;
using namespace taxi_fare::test;

int main() {
    std::cout << "Testing batch predictor (end to end)..." << std::endl;
    Checker c;
    TempDir tmp;

    /* ---------- fixtures ---------- */
    std::ostringstream train;
    train << CSV_HEADER;
    for (int i = 0; i < 30; ++i) {
        const double dist = 0.5 + 0.5 * i;
        train << "VTS,1,1," << 200 + 40 * i << ',' << dist << ",CSH," << 3.0 + 2.5 * dist << '\n';
    }
    const std::string train_csv = tmp.file("taxi-fare-train.csv");
    write_file(train_csv, train.str());

    const std::string test_csv = tmp.file("taxi-fare-test.csv");
    write_file(test_csv, std::string(CSV_HEADER) + "VTS,1,1,300,1.0,CSH,5.0\n");

    TrainOpt opt;
    const FareModel model = train_model(load_trips(train_csv), opt);

    /* ---------- evaluation ---------- */
    const RegressionMetrics m = evaluate(model, train_csv);
    c.check(std::isfinite(m.r_squared) && std::isfinite(m.rmse), "metrics are finite");
    c.check(m.rmse >= 0.0 && m.r_squared <= 1.0, "RMSE >= 0 and R2 <= 1");
    c.check(std::isfinite(evaluate(model, test_csv).rmse), "one-row test set evaluates");

    /* ---------- one-row scenario ---------- */
    const std::string test_out = tmp.file("test_predicted.csv");
    c.check(predict_and_write(model, test_csv, test_out) == 1, "one row predicted");

    const auto lines = read_lines(test_out);
    c.check(lines.size() == 2 && lines[0] == PREDICTED_HEADER, "fixed 8-column header first");
    if (lines.size() == 2) {
        const auto f = split_fields(lines[1]);
        c.check(f.size() == 8, "data line has 8 fields");
        if (f.size() == 8) {
            c.check(f[0] == "VTS" && f[1] == "1" && f[2] == "1" && f[3] == "300" &&
                    f[4] == "1" && f[5] == "CSH" && f[6] == "5",
                    "first 7 fields echo the input values");
            const double pred = std::stod(f[7]);
            c.check(std::isfinite(pred) && pred > 0.0, "PredictedFareAmount > 0");
        }
    }

    /* ---------- whole training file ---------- */
    const std::string train_out = tmp.file("train_predicted.csv");
    const size_t n = predict_and_write(model, train_csv, train_out);
    const auto in_lines  = read_lines(train_csv);
    const auto out_lines = read_lines(train_out);
    c.check(n == 30 && out_lines.size() == in_lines.size(), "output rows == input rows");

    bool echo = out_lines.size() == in_lines.size();
    bool finite = echo;
    for (size_t i = 1; i < out_lines.size() && echo; ++i) {
        const auto in_f  = split_fields(in_lines[i]);
        const auto out_f = split_fields(out_lines[i]);
        for (int k = 0; k < TRIP_COLUMNS; ++k) {
            if (k == 4 || k == 6) echo = echo && std::stod(in_f[k]) == std::stod(out_f[k]);
            else                  echo = echo && in_f[k] == out_f[k];
        }
        finite = finite && std::isfinite(std::stod(out_f[7]));
    }
    c.check(echo, "raw fields unchanged, load order kept");
    c.check(finite, "every prediction is finite");

    /* ---------- idempotence / overwrite ---------- */
    const std::string first = read_file(train_out);
    predict_and_write(model, train_csv, train_out);
    c.check(read_file(train_out) == first, "second run writes a byte-identical file");

    write_file(test_out, "stale content that is much longer than the real output\n\n\n\n");
    predict_and_write(model, test_csv, test_out);
    c.check(read_lines(test_out).size() == 2, "existing output file is overwritten");

    /* ---------- streaming map ---------- */
    {
        TripReader reader(test_csv);
        const auto rows = predict_trips(model, reader);
        c.check(rows.size() == 1 && rows[0].trip.fare_amount == 5.0 &&
                rows[0].predicted_fare_amount == predict(model, rows[0].trip).fare_amount,
                "FareAmount kept, prediction stored beside it");
    }

    /* ---------- header-only test file ---------- */
    const std::string empty_csv = tmp.file("empty-test.csv");
    write_file(empty_csv, CSV_HEADER);
    const RegressionMetrics none = evaluate(model, empty_csv);
    c.check(none.count == 0 && std::isnan(none.r_squared) && std::isnan(none.rmse),
            "empty test set evaluates to NaN metrics");
    const std::string empty_out = tmp.file("empty_predicted.csv");
    c.check(predict_and_write(model, empty_csv, empty_out) == 0, "no rows predicted");
    c.check(read_file(empty_out) == std::string(PREDICTED_HEADER) + "\n",
            "output holds only the header line");

    /* ---------- failures ---------- */
    c.check_throws([&] { predict_and_write(model, test_csv, tmp.file("missing_dir/out.csv")); },
                   "unwritable output path throws");
    c.check_throws([&] { predict_and_write(model, tmp.file("absent.csv"), tmp.file("x.csv")); },
                   "missing input file throws");

    return c.failures();
}

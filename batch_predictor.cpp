#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "batch_predictor.hpp"
#include "common.hpp"

namespace taxi_fare {

std::vector<PredictedTrip> predict_trips(const FareModel& model, TripReader& reader)
{
    std::vector<PredictedTrip> rows;
    std::transform(reader.begin(), reader.end(), std::back_inserter(rows),
                   [&model](const TripRecord& trip) {
                       PredictedTrip row;
                       row.trip                  = trip;
                       row.predicted_fare_amount = predict(model, trip).fare_amount;
                       return row;
                   });
    return rows;
}

std::string format_predicted_row(const PredictedTrip& row)
{
    const TripRecord& t = row.trip;
    std::string line;
    line += t.vendor_id;                          line += ',';
    line += t.rate_code;                          line += ',';
    line += std::to_string(t.passenger_count);    line += ',';
    line += std::to_string(t.trip_time);          line += ',';
    line += format_number(t.trip_distance);       line += ',';
    line += t.payment_type;                       line += ',';
    line += format_number(t.fare_amount);         line += ',';
    line += format_number(row.predicted_fare_amount);
    return line;
}

void write_predictions(std::ostream& out, const std::vector<PredictedTrip>& rows)
{
    out << PREDICTED_HEADER << '\n';
    for (const auto& r : rows) out << format_predicted_row(r) << '\n';
}

void write_predictions(const std::string& path, const std::vector<PredictedTrip>& rows)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        throw std::runtime_error("cannot open output file for writing: " + path);

    write_predictions(out, rows);
    out.flush();
    if (!out)
        throw std::runtime_error("write failed: " + path);
}

size_t predict_and_write(const FareModel& model,
                         const std::string& data_path,
                         const std::string& output_path)
{
    std::vector<PredictedTrip> rows;
    {
        TripReader reader(data_path);
        rows = predict_trips(model, reader);
    }
    write_predictions(output_path, rows);

    logI("Wrote " + std::to_string(rows.size()) + " predictions to " + output_path);
    return rows.size();
}

} // namespace taxi_fare

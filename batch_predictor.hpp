#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "fare_model.hpp"
#include "trip_loader.hpp"
#include "trip_record.hpp"

namespace taxi_fare {

/* map over the stream, one single-row prediction per trip, load order kept */
std::vector<PredictedTrip> predict_trips(const FareModel& model, TripReader& reader);

/* one CSV line, PREDICTED_HEADER layout, no trailing newline */
std::string format_predicted_row(const PredictedTrip& row);

void write_predictions(std::ostream& out, const std::vector<PredictedTrip>& rows);

/* truncates `path`; throws if it cannot be opened or written */
void write_predictions(const std::string& path, const std::vector<PredictedTrip>& rows);

/* fresh load of data_path → predict → write; returns rows written */
size_t predict_and_write(const FareModel& model,
                         const std::string& data_path,
                         const std::string& output_path);

} // namespace taxi_fare

/*───────────────────────────────────────────────────────────
 *  trip_record.hpp   –  row shapes for input / model output
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <string>

namespace taxi_fare {

/* ---------- CSV layout ---------- */
constexpr int TRIP_COLUMNS = 7;

constexpr const char* TRIP_HEADER =
    "VendorId,RateCode,PassengerCount,TripTime,TripDistance,PaymentType,FareAmount";
constexpr const char* PREDICTED_HEADER =
    "VendorId,RateCode,PassengerCount,TripTime,TripDistance,PaymentType,FareAmount,"
    "PredictedFareAmount";

/* one trip, columns in file order */
struct TripRecord {
    std::string vendor_id;           // categorical
    std::string rate_code;           // categorical
    int         passenger_count = 0;
    int         trip_time       = 0; // seconds, never a feature
    double      trip_distance   = 0;
    std::string payment_type;        // categorical
    double      fare_amount     = 0; // label
};

/* model output for one trip */
struct FarePrediction {
    double fare_amount = 0;
};

/* output row: untouched input + the estimate */
struct PredictedTrip {
    TripRecord trip;
    double     predicted_fare_amount = 0;
};

} // namespace taxi_fare

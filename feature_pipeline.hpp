/*───────────────────────────────────────────────────────────
 *  feature_pipeline.hpp   –  Label copy, one-hot, concat
 *
 *  Features layout (fixed, the booster depends on it):
 *      VendorIdEncoded | RateCodeEncoded | PassengerCount |
 *      TripDistance    | PaymentTypeEncoded
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "trip_record.hpp"

namespace taxi_fare {

using FeatureMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/*  One categorical column → indicator vector.
 *  Slots are assigned in order of first occurrence during fit.
 *  A token never seen during fit encodes as all zeros.          */
class OneHotEncoder {
public:
    OneHotEncoder() = default;
    explicit OneHotEncoder(std::string column) : column_(std::move(column)) {}

    /* add `token` to the vocabulary if new */
    void fit(const std::string& token);

    size_t width() const { return vocab_.size(); }

    /* slot of `token`, -1 when unseen */
    int index_of(const std::string& token) const;

    /* writes width() values starting at out */
    void encode(const std::string& token, double* out) const;

    const std::string&              column()     const { return column_; }
    const std::vector<std::string>& vocabulary() const { return vocab_; }

    nlohmann::json       to_json() const;
    static OneHotEncoder from_json(const nlohmann::json& j);

private:
    std::string                          column_;
    std::vector<std::string>             vocab_;
    std::unordered_map<std::string, int> index_;
};

class FeaturePipeline {
public:
    /* learns the three vocabularies; throws on an empty set */
    static FeaturePipeline fit(const std::vector<TripRecord>& trips);

    size_t width() const;

    /* "Label" column: a copy of FareAmount */
    static double label(const TripRecord& t) { return t.fare_amount; }

    std::vector<double> encode(const TripRecord& t) const;
    void                encode_into(const TripRecord& t, double* row) const;

    FeatureMatrix   encode_all(const std::vector<TripRecord>& trips) const;
    Eigen::VectorXd labels(const std::vector<TripRecord>& trips) const;

    /* one unique name per column, e.g. "VendorId=CMT", "TripDistance" */
    std::vector<std::string> feature_names() const;

    const OneHotEncoder& vendor()  const { return vendor_; }
    const OneHotEncoder& rate()    const { return rate_; }
    const OneHotEncoder& payment() const { return payment_; }

    nlohmann::json         to_json() const;
    static FeaturePipeline from_json(const nlohmann::json& j);

private:
    OneHotEncoder vendor_ {"VendorId"};
    OneHotEncoder rate_   {"RateCode"};
    OneHotEncoder payment_{"PaymentType"};
};

} // namespace taxi_fare

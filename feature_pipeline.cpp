/* -----------------------------------------------------------
 *  feature_pipeline.cpp
 * ----------------------------------------------------------- */
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>

#include "feature_pipeline.hpp"

using json = nlohmann::json;

namespace taxi_fare {

/* ────────────────── OneHotEncoder ────────────────── */

void OneHotEncoder::fit(const std::string& token)
{
    if (index_.count(token)) return;
    index_.emplace(token, static_cast<int>(vocab_.size()));
    vocab_.push_back(token);
}

int OneHotEncoder::index_of(const std::string& token) const
{
    auto it = index_.find(token);
    return it == index_.end() ? -1 : it->second;
}

void OneHotEncoder::encode(const std::string& token, double* out) const
{
    std::fill(out, out + width(), 0.0);
    const int slot = index_of(token);
    if (slot >= 0) out[slot] = 1.0;
}

json OneHotEncoder::to_json() const
{
    return json{{"column", column_}, {"vocabulary", vocab_}};
}

OneHotEncoder OneHotEncoder::from_json(const json& j)
{
    OneHotEncoder enc(j.at("column").get<std::string>());
    for (const auto& tok : j.at("vocabulary")) enc.fit(tok.get<std::string>());
    if (enc.width() != j.at("vocabulary").size())
        throw std::runtime_error("duplicate token in vocabulary of " + enc.column());
    return enc;
}

/* ────────────────── FeaturePipeline ────────────────── */

FeaturePipeline FeaturePipeline::fit(const std::vector<TripRecord>& trips)
{
    if (trips.empty())
        throw std::runtime_error("cannot fit feature pipeline: no training rows");

    FeaturePipeline p;
    for (const auto& t : trips) {
        p.vendor_.fit(t.vendor_id);
        p.rate_.fit(t.rate_code);
        p.payment_.fit(t.payment_type);
    }
    return p;
}

size_t FeaturePipeline::width() const
{
    return vendor_.width() + rate_.width() + 2 + payment_.width();
}

void FeaturePipeline::encode_into(const TripRecord& t, double* row) const
{
    double* p = row;
    vendor_.encode(t.vendor_id, p);  p += vendor_.width();
    rate_.encode(t.rate_code, p);    p += rate_.width();
    *p++ = static_cast<double>(t.passenger_count);
    *p++ = t.trip_distance;
    payment_.encode(t.payment_type, p);
}

std::vector<double> FeaturePipeline::encode(const TripRecord& t) const
{
    std::vector<double> row(width());
    encode_into(t, row.data());
    return row;
}

FeatureMatrix FeaturePipeline::encode_all(const std::vector<TripRecord>& trips) const
{
    FeatureMatrix X(static_cast<Eigen::Index>(trips.size()),
                    static_cast<Eigen::Index>(width()));
    for (size_t i = 0; i < trips.size(); ++i)
        encode_into(trips[i], X.row(static_cast<Eigen::Index>(i)).data());
    return X;
}

Eigen::VectorXd FeaturePipeline::labels(const std::vector<TripRecord>& trips) const
{
    Eigen::VectorXd y(static_cast<Eigen::Index>(trips.size()));
    for (size_t i = 0; i < trips.size(); ++i)
        y[static_cast<Eigen::Index>(i)] = label(trips[i]);
    return y;
}

/* LightGBM rejects JSON punctuation and whitespace in feature names */
static std::string safe_feature_name(const std::string& s)
{
    std::string out = s;
    for (char& c : out) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '=' && c != '.' && c != '-') c = '_';
    }
    return out;
}

std::vector<std::string> FeaturePipeline::feature_names() const
{
    std::vector<std::string> names;
    names.reserve(width());
    std::unordered_set<std::string> used{"PassengerCount", "TripDistance"};
    /* "A B" and "A_B" sanitise to one name; the later one gets _2, _3, .. */
    auto unique_name = [&used](const std::string& base) {
        std::string name = base;
        for (int k = 2; !used.insert(name).second; ++k)
            name = base + "_" + std::to_string(k);
        return name;
    };
    auto add_encoded = [&](const OneHotEncoder& enc) {
        for (const auto& tok : enc.vocabulary())
            names.push_back(unique_name(safe_feature_name(enc.column() + "=" + tok)));
    };
    add_encoded(vendor_);
    add_encoded(rate_);
    names.push_back("PassengerCount");
    names.push_back("TripDistance");
    add_encoded(payment_);
    return names;
}

json FeaturePipeline::to_json() const
{
    return json{{"encoders", json::array({vendor_.to_json(), rate_.to_json(),
                                          payment_.to_json()})},
                {"feature_names", feature_names()},
                {"width", width()}};
}

FeaturePipeline FeaturePipeline::from_json(const json& j)
{
    const json& enc = j.at("encoders");
    if (!enc.is_array() || enc.size() != 3)
        throw std::runtime_error("pipeline must carry exactly 3 encoders");

    FeaturePipeline p;
    p.vendor_  = OneHotEncoder::from_json(enc[0]);
    p.rate_    = OneHotEncoder::from_json(enc[1]);
    p.payment_ = OneHotEncoder::from_json(enc[2]);

    if (p.vendor_.column() != "VendorId" || p.rate_.column() != "RateCode" ||
        p.payment_.column() != "PaymentType")
        throw std::runtime_error("pipeline encoders are out of order");

    if (j.contains("width") && j["width"].get<size_t>() != p.width())
        throw std::runtime_error("pipeline width does not match its vocabularies");
    return p;
}

} // namespace taxi_fare

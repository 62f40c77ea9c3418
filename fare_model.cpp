/*
 * fare_model.cpp
 *
 * Fare regressor on top of the LightGBM C API: fit, single-row and batch
 * scoring, feature importance, JSON artifact save / load.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "fare_model.hpp"

using json = nlohmann::json;

namespace taxi_fare {

namespace {

constexpr const char* MODEL_FORMAT = "taxi_fare.model/1";
constexpr size_t      TOP_FEATURES = 5;

struct DatasetGuard {
    DatasetHandle h = nullptr;
    ~DatasetGuard() { if (h) LGBM_DatasetFree(h); }
};

struct BoosterGuard {
    BoosterHandle h = nullptr;
    ~BoosterGuard() { if (h) LGBM_BoosterFree(h); }
    BoosterHandle release() { BoosterHandle out = h; h = nullptr; return out; }
};

void log_top_features(const FareModel& model)
{
    auto imp = model.feature_importance();
    std::stable_sort(imp.begin(), imp.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::ostringstream oss;
    oss << "Top features (split count):";
    size_t shown = 0;
    for (const auto& p : imp) {
        if (shown == TOP_FEATURES || p.second <= 0.0) break;
        oss << ' ' << p.first << '=' << p.second;
        ++shown;
    }
    if (shown == 0) oss << " none (trees have no splits)";
    logI(oss.str());
}

} // namespace

void lgb_check(int ret, const std::string& what)
{
    if (ret != 0)
        throw std::runtime_error(what + " failed: " + LGBM_GetLastError());
}

std::string build_param_string(const TrainOpt& opt)
{
    std::ostringstream oss;
    oss << "objective=regression"
        << " metric=rmse"
        << " boosting=gbdt"
        << " num_iterations=" << opt.trees
        << " num_leaves=" << opt.leaves
        << " min_data_in_leaf=" << opt.min_leaf
        << " learning_rate=" << opt.lr
        << " max_bin=" << opt.max_bin
        << " seed=" << opt.seed
        << " deterministic=true"
        << " force_row_wise=true"
        << " num_threads=1"
        << " verbosity=" << (opt.verbose ? 0 : -1);
    return oss.str();
}

/* ────────────────── FareModel ────────────────── */

FareModel::FareModel(FeaturePipeline pipeline, BoosterHandle booster, TrainStats stats)
    : pipeline_(std::move(pipeline)), booster_(booster), stats_(std::move(stats))
{
    if (!booster_) throw std::invalid_argument("FareModel needs a booster");
}

FareModel::~FareModel()
{
    if (booster_) LGBM_BoosterFree(booster_);
}

FareModel::FareModel(FareModel&& other) noexcept
    : pipeline_(std::move(other.pipeline_)),
      booster_(other.booster_),
      stats_(std::move(other.stats_))
{
    other.booster_ = nullptr;
}

FareModel& FareModel::operator=(FareModel&& other) noexcept
{
    if (this != &other) {
        if (booster_) LGBM_BoosterFree(booster_);
        pipeline_      = std::move(other.pipeline_);
        booster_       = other.booster_;
        stats_         = std::move(other.stats_);
        other.booster_ = nullptr;
    }
    return *this;
}

double FareModel::score_row(const std::vector<double>& features) const
{
    if (features.size() != pipeline_.width()) {
        throw std::runtime_error("feature row has " + std::to_string(features.size()) +
                                 " values, model expects " +
                                 std::to_string(pipeline_.width()));
    }

    int64_t out_len = 0;
    double  out     = 0.0;
    lgb_check(LGBM_BoosterPredictForMatSingleRow(booster_,
                                                 features.data(),
                                                 C_API_DTYPE_FLOAT64,
                                                 static_cast<int32_t>(features.size()),
                                                 /*is_row_major=*/1,
                                                 C_API_PREDICT_NORMAL,
                                                 /*start_iteration=*/0,
                                                 /*num_iteration=*/-1,
                                                 /*parameter=*/"",
                                                 &out_len,
                                                 &out),
              "LGBM_BoosterPredictForMatSingleRow");
    if (out_len != 1)
        throw std::runtime_error("single-row prediction returned " +
                                 std::to_string(out_len) + " values");
    return out;
}

Eigen::VectorXd FareModel::score_rows(const FeatureMatrix& X) const
{
    if (X.rows() == 0) return Eigen::VectorXd();
    if (X.cols() != static_cast<Eigen::Index>(pipeline_.width()))
        throw std::runtime_error("feature matrix width does not match the model");

    Eigen::VectorXd out(X.rows());
    int64_t out_len = 0;
    lgb_check(LGBM_BoosterPredictForMat(booster_,
                                        X.data(),
                                        C_API_DTYPE_FLOAT64,
                                        static_cast<int32_t>(X.rows()),
                                        static_cast<int32_t>(X.cols()),
                                        /*is_row_major=*/1,
                                        C_API_PREDICT_NORMAL,
                                        /*start_iteration=*/0,
                                        /*num_iteration=*/-1,
                                        /*parameter=*/"",
                                        &out_len,
                                        out.data()),
              "LGBM_BoosterPredictForMat");
    if (out_len != X.rows())
        throw std::runtime_error("batch prediction returned " + std::to_string(out_len) +
                                 " values for " + std::to_string(X.rows()) + " rows");
    return out;
}

std::vector<std::pair<std::string, double>> FareModel::feature_importance() const
{
    int n = 0;
    lgb_check(LGBM_BoosterGetNumFeature(booster_, &n), "LGBM_BoosterGetNumFeature");

    std::vector<double> imp(static_cast<size_t>(n), 0.0);
    lgb_check(LGBM_BoosterFeatureImportance(booster_, /*num_iteration=*/0,
                                            C_API_FEATURE_IMPORTANCE_SPLIT, imp.data()),
              "LGBM_BoosterFeatureImportance");

    const auto names = pipeline_.feature_names();
    if (names.size() != imp.size())
        throw std::runtime_error("booster has " + std::to_string(imp.size()) +
                                 " features, pipeline names " + std::to_string(names.size()));

    std::vector<std::pair<std::string, double>> out;
    out.reserve(imp.size());
    for (size_t i = 0; i < imp.size(); ++i) out.emplace_back(names[i], imp[i]);
    return out;
}

/* ────────────────── training ────────────────── */

FareModel train_model(const std::vector<TripRecord>& trips, const TrainOpt& opt)
{
    if (trips.empty())
        throw std::runtime_error("cannot train: no training rows");

    const auto start = std::chrono::steady_clock::now();

    FeaturePipeline pipe = FeaturePipeline::fit(trips);
    const FeatureMatrix X = pipe.encode_all(trips);
    if (X.cols() != static_cast<Eigen::Index>(pipe.width()))
        throw std::runtime_error("inconsistent feature width");

    const int nrow = static_cast<int>(X.rows());
    const int ncol = static_cast<int>(X.cols());

    /* LightGBM wants float32 labels */
    std::vector<float> y(trips.size());
    for (size_t i = 0; i < trips.size(); ++i)
        y[i] = static_cast<float>(FeaturePipeline::label(trips[i]));

    logI("Features: " + std::to_string(ncol) + " columns (VendorId " +
         std::to_string(pipe.vendor().width()) + ", RateCode " +
         std::to_string(pipe.rate().width()) + ", PaymentType " +
         std::to_string(pipe.payment().width()) + " categories)");

    const std::string params = build_param_string(opt);
    logI("LightGBM params: " + params);

    DatasetGuard dtrain;
    lgb_check(LGBM_DatasetCreateFromMat(X.data(), C_API_DTYPE_FLOAT64,
                                        nrow, ncol, /*is_row_major=*/1,
                                        params.c_str(), nullptr, &dtrain.h),
              "LGBM_DatasetCreateFromMat");
    lgb_check(LGBM_DatasetSetField(dtrain.h, "label", y.data(), nrow, C_API_DTYPE_FLOAT32),
              "LGBM_DatasetSetField(label)");

    const std::vector<std::string> names = pipe.feature_names();
    std::vector<const char*> cnames;
    cnames.reserve(names.size());
    for (const auto& n : names) cnames.push_back(n.c_str());
    lgb_check(LGBM_DatasetSetFeatureNames(dtrain.h, cnames.data(), ncol),
              "LGBM_DatasetSetFeatureNames");

    BoosterGuard booster;
    lgb_check(LGBM_BoosterCreate(dtrain.h, params.c_str(), &booster.h), "LGBM_BoosterCreate");

    for (int it = 0; it < opt.trees; ++it) {
        int is_finished = 0;
        lgb_check(LGBM_BoosterUpdateOneIter(booster.h, &is_finished),
                  "LGBM_BoosterUpdateOneIter");
        if (opt.verbose) progress("boosting", static_cast<size_t>(it + 1),
                                  static_cast<size_t>(opt.trees));
        if (is_finished) {
            if (opt.verbose) std::cerr << '\n';
            logI("no split left to make, stopped after round " + std::to_string(it + 1));
            break;
        }
    }

    TrainStats stats;
    stats.rows   = trips.size();
    stats.params = params;
    lgb_check(LGBM_BoosterGetCurrentIteration(booster.h, &stats.rounds),
              "LGBM_BoosterGetCurrentIteration");
    stats.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    FareModel model(std::move(pipe), booster.release(), std::move(stats));

    std::ostringstream done;
    done << "Trained " << model.stats().rounds << " rounds on " << model.stats().rows
         << " rows in " << model.stats().seconds << " s";
    logI(done.str());
    log_top_features(model);
    return model;
}

FarePrediction predict(const FareModel& model, const TripRecord& trip)
{
    FarePrediction p;
    p.fare_amount = model.score_row(model.pipeline().encode(trip));
    return p;
}

/* ────────────────── persistence ────────────────── */

void save_model(const FareModel& model, const std::string& path)
{
    int64_t     out_len = 0;
    std::string text(1 << 16, '\0');
    lgb_check(LGBM_BoosterSaveModelToString(model.booster(), 0, -1,
                                            C_API_FEATURE_IMPORTANCE_SPLIT,
                                            static_cast<int64_t>(text.size()),
                                            &out_len, &text[0]),
              "LGBM_BoosterSaveModelToString");
    if (out_len > static_cast<int64_t>(text.size())) {
        text.assign(static_cast<size_t>(out_len), '\0');
        lgb_check(LGBM_BoosterSaveModelToString(model.booster(), 0, -1,
                                                C_API_FEATURE_IMPORTANCE_SPLIT,
                                                static_cast<int64_t>(text.size()),
                                                &out_len, &text[0]),
                  "LGBM_BoosterSaveModelToString");
    }
    text.resize(out_len > 0 ? static_cast<size_t>(out_len - 1) : 0);   // drop '\0'

    const TrainStats& st = model.stats();
    json doc;
    doc["format"]      = MODEL_FORMAT;
    doc["pipeline"]    = model.pipeline().to_json();
    doc["booster"]     = text;
    doc["train_stats"] = {
        {"rows",    st.rows},
        {"rounds",  st.rounds},
        {"seconds", st.seconds},
        {"params",  st.params}
    };

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        throw std::runtime_error("cannot open model file for writing: " + path);
    out << doc.dump(2) << '\n';
    out.flush();
    if (!out)
        throw std::runtime_error("write failed: " + path);

    logI("Model saved to: " + path);
}

FareModel load_model(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("cannot open model file: " + path);

    FeaturePipeline pipe;
    std::string     booster_text;
    TrainStats      stats;
    try {
        json doc;
        in >> doc;
        if (doc.value("format", std::string()) != MODEL_FORMAT)
            throw std::runtime_error(path + ": not a fare model (format tag mismatch)");

        pipe         = FeaturePipeline::from_json(doc.at("pipeline"));
        booster_text = doc.at("booster").get<std::string>();
        if (doc.contains("train_stats")) {
            const json& st = doc["train_stats"];
            stats.rows    = st.value("rows", size_t(0));
            stats.rounds  = st.value("rounds", 0);
            stats.seconds = st.value("seconds", 0.0);
            stats.params  = st.value("params", std::string());
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    }

    BoosterGuard booster;
    int iters = 0;
    lgb_check(LGBM_BoosterLoadModelFromString(booster_text.c_str(), &iters, &booster.h),
              "LGBM_BoosterLoadModelFromString");

    int nfeat = 0;
    lgb_check(LGBM_BoosterGetNumFeature(booster.h, &nfeat), "LGBM_BoosterGetNumFeature");
    if (static_cast<size_t>(nfeat) != pipe.width()) {
        throw std::runtime_error(path + ": booster has " + std::to_string(nfeat) +
                                 " features, pipeline width is " +
                                 std::to_string(pipe.width()));
    }

    logI("Model loaded from: " + path + " (" + std::to_string(iters) + " rounds)");
    return FareModel(std::move(pipe), booster.release(), std::move(stats));
}

} // namespace taxi_fare

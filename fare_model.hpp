/* ──────────────────────────────────────────────────────────────
   fare_model.hpp   –  fitted pipeline + LightGBM booster
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include <LightGBM/c_api.h>

#include "feature_pipeline.hpp"
#include "trip_record.hpp"

namespace taxi_fare {

/* boosting hyper-params */
struct TrainOpt {
    int     trees    = 100;    // boosting rounds
    int     leaves   = 20;     // max leaves per tree
    int     min_leaf = 10;     // min rows per leaf
    double  lr       = 0.2;
    int     max_bin  = 255;
    int     seed     = 0;      // every stochastic LightGBM component
    bool    verbose  = false;
};

struct TrainStats {
    size_t      rows    = 0;
    int         rounds  = 0;
    double      seconds = 0.0;
    std::string params;
};

/*  Immutable after construction.  Owns the booster handle; moves
    transfer ownership, copies are not allowed.                    */
class FareModel {
public:
    FareModel(FeaturePipeline pipeline, BoosterHandle booster, TrainStats stats);
    ~FareModel();

    FareModel(FareModel&& other) noexcept;
    FareModel& operator=(FareModel&& other) noexcept;
    FareModel(const FareModel&)            = delete;
    FareModel& operator=(const FareModel&) = delete;

    const FeaturePipeline& pipeline() const { return pipeline_; }
    const TrainStats&      stats()    const { return stats_; }
    BoosterHandle          booster()  const { return booster_; }

    /* one already-encoded row of pipeline().width() values */
    double score_row(const std::vector<double>& features) const;

    /* batch scoring, one value per matrix row */
    Eigen::VectorXd score_rows(const FeatureMatrix& X) const;

    /* split counts, paired with feature names, in feature order */
    std::vector<std::pair<std::string, double>> feature_importance() const;

private:
    FeaturePipeline pipeline_;
    BoosterHandle   booster_ = nullptr;
    TrainStats      stats_;
};

/* throws std::runtime_error with LGBM_GetLastError() when ret != 0 */
void lgb_check(int ret, const std::string& what);

std::string build_param_string(const TrainOpt& opt);

/* label copy → one-hot ×3 → concat → LightGBM regression */
FareModel train_model(const std::vector<TripRecord>& trips, const TrainOpt& opt);

/* pure, one trip at a time */
FarePrediction predict(const FareModel& model, const TripRecord& trip);

/* single JSON artifact: pipeline + booster text + train stats */
void      save_model(const FareModel& model, const std::string& path);
FareModel load_model(const std::string& path);

} // namespace taxi_fare

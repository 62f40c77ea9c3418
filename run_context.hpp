/* -----------------------------------------------------------
 *  run_context.hpp – paths + hyper-params for one run
 *
 *  Built once by run_cli() and handed to every step by const
 *  reference.  Sources, later wins:
 *      defaults → --config=<file.json> → --key=value flags
 * ----------------------------------------------------------- */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "fare_model.hpp"

namespace taxi_fare {

struct RunContext {
    std::string data_dir = "Data";

    /* empty → derived from data_dir by resolve_paths() */
    std::string train_path;
    std::string test_path;
    std::string model_path;

    std::string train_out = "train_predicted.csv";
    std::string test_out  = "test_predicted.csv";

    TrainOpt opt;

    bool save_model = false;   // write model_path after training
    bool load_model = false;   // skip training, read model_path
};

/* fill empty paths: <data_dir>/taxi-fare-{train,test}.csv, <data_dir>/Model.json */
void resolve_paths(RunContext& ctx);

/* apply a JSON object using the flag names as keys */
void apply_config(RunContext& ctx, const nlohmann::json& cfg);
void apply_config_file(RunContext& ctx, const std::string& path);

/* apply one "--key=value" or bare "--flag"; false if the key is unknown */
bool apply_flag(RunContext& ctx, const std::string& arg);

/* throws std::runtime_error on out-of-range values / conflicting modes */
void validate(const RunContext& ctx);

RunContext parse_cli(int argc, char* argv[]);

} // namespace taxi_fare

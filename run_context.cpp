#include <cmath>
#include <fstream>
#include <stdexcept>

#include "common.hpp"
#include "run_context.hpp"

using json = nlohmann::json;

namespace taxi_fare {

namespace {

int to_int(const std::string& key, const std::string& v)
{
    size_t pos = 0;
    int    out = 0;
    try {
        out = std::stoi(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("--" + key + ": '" + v + "' is not an integer");
    }
    if (pos != v.size())
        throw std::runtime_error("--" + key + ": '" + v + "' is not an integer");
    return out;
}

double to_double(const std::string& key, const std::string& v)
{
    size_t pos = 0;
    double out = 0;
    try {
        out = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("--" + key + ": '" + v + "' is not a number");
    }
    if (pos != v.size())
        throw std::runtime_error("--" + key + ": '" + v + "' is not a number");
    return out;
}

bool to_bool(const std::string& key, const std::string& v)
{
    if (v == "true"  || v == "1") return true;
    if (v == "false" || v == "0") return false;
    throw std::runtime_error("--" + key + ": '" + v + "' is not a boolean");
}

/* false when `key` is not a setting */
bool set_value(RunContext& ctx, const std::string& key, const std::string& v)
{
    TrainOpt& o = ctx.opt;
    if      (key == "data_dir")   ctx.data_dir   = v;
    else if (key == "train")      ctx.train_path = v;
    else if (key == "test")       ctx.test_path  = v;
    else if (key == "model")      ctx.model_path = v;
    else if (key == "train_out")  ctx.train_out  = v;
    else if (key == "test_out")   ctx.test_out   = v;
    else if (key == "trees")      o.trees    = to_int(key, v);
    else if (key == "leaves")     o.leaves   = to_int(key, v);
    else if (key == "min_leaf")   o.min_leaf = to_int(key, v);
    else if (key == "lr")         o.lr       = to_double(key, v);
    else if (key == "max_bin")    o.max_bin  = to_int(key, v);
    else if (key == "seed")       o.seed     = to_int(key, v);
    else if (key == "verbose")    o.verbose  = to_bool(key, v);
    else if (key == "save_model") ctx.save_model = to_bool(key, v);
    else if (key == "load_model") ctx.load_model = to_bool(key, v);
    else return false;
    return true;
}

} // namespace

void resolve_paths(RunContext& ctx)
{
    const std::string base = ctx.data_dir.empty() ? std::string(".") : ctx.data_dir;
    if (ctx.train_path.empty()) ctx.train_path = base + "/taxi-fare-train.csv";
    if (ctx.test_path.empty())  ctx.test_path  = base + "/taxi-fare-test.csv";
    if (ctx.model_path.empty()) ctx.model_path = base + "/Model.json";
}

void apply_config(RunContext& ctx, const json& cfg)
{
    if (!cfg.is_object())
        throw std::runtime_error("config must be a JSON object");

    for (auto it = cfg.begin(); it != cfg.end(); ++it) {
        const json& v = it.value();
        const std::string text = v.is_string() ? v.get<std::string>() : v.dump();
        if (!set_value(ctx, it.key(), text))
            logW("ignored config key: " + it.key());
    }
}

void apply_config_file(RunContext& ctx, const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("cannot open config file: " + path);

    json cfg;
    try {
        in >> cfg;
    } catch (const json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    apply_config(ctx, cfg);
    logI("Loaded config from " + path);
}

bool apply_flag(RunContext& ctx, const std::string& a)
{
    if (a.rfind("--", 0) != 0) return false;

    const size_t eq = a.find('=');
    if (eq == std::string::npos) {
        const std::string key = a.substr(2);
        if (key == "save_model" || key == "load_model" || key == "verbose")
            return set_value(ctx, key, "true");
        return false;
    }
    return set_value(ctx, a.substr(2, eq - 2), a.substr(eq + 1));
}

void validate(const RunContext& ctx)
{
    const TrainOpt& o = ctx.opt;
    if (o.trees < 1)    throw std::runtime_error("--trees must be >= 1");
    if (o.leaves < 2)   throw std::runtime_error("--leaves must be >= 2");
    if (o.min_leaf < 0) throw std::runtime_error("--min_leaf must be >= 0");
    if (!(o.lr > 0.0) || !std::isfinite(o.lr))
        throw std::runtime_error("--lr must be a positive number");
    if (o.max_bin < 2)  throw std::runtime_error("--max_bin must be >= 2");

    if (ctx.save_model && ctx.load_model)
        throw std::runtime_error("use --save_model OR --load_model, not both");

    if (ctx.train_path.empty() || ctx.test_path.empty() || ctx.model_path.empty() ||
        ctx.train_out.empty() || ctx.test_out.empty())
        throw std::runtime_error("file paths must not be empty");
}

RunContext parse_cli(int argc, char* argv[])
{
    RunContext ctx;

    /* config file first so flags can override it */
    for (int i = 1; i < argc; ++i) {
        const std::string a(argv[i]);
        if (a.rfind("--config=", 0) == 0) apply_config_file(ctx, a.substr(9));
    }
    for (int i = 1; i < argc; ++i) {
        const std::string a(argv[i]);
        if (a.rfind("--config=", 0) == 0) continue;
        if (!apply_flag(ctx, a)) logW("ignored arg: " + a);
    }

    resolve_paths(ctx);
    validate(ctx);
    return ctx;
}

} // namespace taxi_fare

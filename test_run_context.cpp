#include <iostream>
#include <vector>

#include "run_context.hpp"
#include "test_support.hpp"

using namespace taxi_fare;
using namespace taxi_fare::test;

static RunContext parse(std::vector<std::string> args)
{
    args.insert(args.begin(), "taxi_fare");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int main() {
    std::cout << "Testing run context..." << std::endl;
    Checker c;
    TempDir tmp;

    const RunContext d = parse({});
    c.check(d.train_path == "Data/taxi-fare-train.csv" && d.test_path == "Data/taxi-fare-test.csv" &&
            d.model_path == "Data/Model.json",
            "default paths live under Data/");
    c.check(d.train_out == "train_predicted.csv" && d.test_out == "test_predicted.csv",
            "outputs go to the working directory");
    c.check(d.opt.seed == 0 && d.opt.trees == 100 && d.opt.leaves == 20 &&
            d.opt.min_leaf == 10 && d.opt.lr == 0.2,
            "default hyper-params");
    c.check(!d.save_model && !d.load_model, "default run retrains and saves nothing");

    const RunContext f = parse({"--data_dir=/tmp/taxi", "--trees=7", "--lr=0.05",
                                "--save_model", "--test=holdout.csv", "--bogus=1"});
    c.check(f.train_path == "/tmp/taxi/taxi-fare-train.csv" && f.test_path == "holdout.csv",
            "data_dir drives unset paths, explicit path wins");
    c.check(f.opt.trees == 7 && f.opt.lr == 0.05 && f.save_model, "flags override defaults");

    /* config file, then flags on top */
    const std::string cfg = tmp.file("cfg.json");
    write_file(cfg, R"({"trees": 55, "leaves": 8, "seed": 3, "verbose": true, "model": "m.json"})");
    const RunContext g = parse({"--config=" + cfg, "--trees=9"});
    c.check(g.opt.trees == 9 && g.opt.leaves == 8 && g.opt.seed == 3 && g.opt.verbose &&
            g.model_path == "m.json",
            "config file applied, flags win over it");

    c.check_throws([] { parse({"--trees=abc"}); }, "non-numeric --trees");
    c.check_throws([] { parse({"--trees=0"}); }, "--trees=0");
    c.check_throws([] { parse({"--leaves=1"}); }, "--leaves=1");
    c.check_throws([] { parse({"--lr=-1"}); }, "negative --lr");
    c.check_throws([] { parse({"--save_model", "--load_model"}); }, "save and load together");
    c.check_throws([&] { parse({"--config=" + tmp.file("absent.json")}); }, "missing config file");

    const std::string bad = tmp.file("bad.json");
    write_file(bad, "[1, 2");
    c.check_throws([&] { parse({"--config=" + bad}); }, "malformed config file");
    write_file(bad, "[1, 2]");
    c.check_throws([&] { parse({"--config=" + bad}); }, "config that is not an object");

    return c.failures();
}

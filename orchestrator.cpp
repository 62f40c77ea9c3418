#include <exception>

#include "batch_predictor.hpp"
#include "common.hpp"
#include "evaluator.hpp"
#include "orchestrator.hpp"
#include "trip_loader.hpp"

namespace taxi_fare {

FareModel obtain_model(const RunContext& ctx)
{
    if (ctx.load_model) return load_model(ctx.model_path);

    FareModel model = train_model(load_trips(ctx.train_path), ctx.opt);
    if (ctx.save_model) save_model(model, ctx.model_path);
    return model;
}

void run(const RunContext& ctx, std::ostream& out)
{
    /* ========== 1. Train (or load) ========================= */
    const FareModel model = obtain_model(ctx);

    /* ========== 2. Evaluate on the hold-out set ============ */
    print_metrics(evaluate(model, ctx.test_path), out);

    /* ========== 3. Row-by-row predictions to CSV =========== */
    predict_and_write(model, ctx.train_path, ctx.train_out);
    predict_and_write(model, ctx.test_path, ctx.test_out);

    out << "Prediction completed and files saved." << std::endl;
}

int run_cli(int argc, char* argv[], std::ostream& out)
{
    try {
        run(parse_cli(argc, argv), out);
    } catch (const std::exception& e) {
        logE(e.what());
        return 1;
    }
    return 0;
}

} // namespace taxi_fare

/* -----------------------------------------------------------
 *  orchestrator.hpp – one full run of the fare program
 *
 *  train (or load) → evaluate → predict train set → predict test set
 * ----------------------------------------------------------- */
#pragma once

#include <ostream>

#include "fare_model.hpp"
#include "run_context.hpp"

namespace taxi_fare {

/* load ctx.model_path, or train on ctx.train_path (then save if asked) */
FareModel obtain_model(const RunContext& ctx);

/*  Banner and completion line go to `out`, logs to stderr.
 *  Throws on the first failing step; prediction files are only
 *  written after evaluation has succeeded.                       */
void run(const RunContext& ctx, std::ostream& out);

/* parse_cli + run; logs the error and returns 1 on failure, else 0 */
int run_cli(int argc, char* argv[], std::ostream& out);

} // namespace taxi_fare

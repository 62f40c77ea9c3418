/* -----------------------------------------------------------
 *  main.cpp – taxi fare driver
 *
 *  train → evaluate → predict train set → predict test set
 *
 *  Run (defaults read ./Data, write ./train_predicted.csv and
 *  ./test_predicted.csv):
 *      ./taxi_fare
 *      ./taxi_fare --trees=200 --lr=0.1 --save_model
 *      ./taxi_fare --load_model --model=Data/Model.json
 * ----------------------------------------------------------- */
#include <iostream>

#include "orchestrator.hpp"

int main(int argc, char* argv[])
{
    return taxi_fare::run_cli(argc, argv, std::cout);
}

#include "api/cycle_cli.hpp"

int main(int argc, char** argv) {
    return cycle_cli::run_cycle_main(argc, argv);
}

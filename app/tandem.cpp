#include "tandem/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        tandem::harness_config cfg{};
        if (auto cli_result = tandem::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return tandem::cli::run(cfg, tandem::make_system_runner(), std::cout);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 3;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 3;
    }
}

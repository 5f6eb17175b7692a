#include "cmdguard/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    cmdguard::cli::App app;
    return app.run(argc, argv);
}

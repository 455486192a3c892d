#include <cstdlib>
#include <spdlog/spdlog.h>
#include "fixcap_rt/app.hpp"

int main(int argc, char **argv) {
    try {
        fixcap_rt::App app(argc, argv);
        app.Launch();
    } catch (std::exception &e) {
        spdlog::critical("Uncaught exception: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

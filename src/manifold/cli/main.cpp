// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/cli/commands.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace manifold::cli;

// Report exceptions escaping noexcept functions before aborting
static void manifold_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(manifold_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& e : args.errors) {
            std::cerr << "Error: " << e << std::endl;
        }
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }

    if (args.manifest.empty()) {
        std::cerr << "Error: No manifest specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }

    auto result = transfer(args);
    if (!result) {
        return 1;
    }
    return *result;
}

// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// dtld -- L2 sequencer unconfirmed transaction ingestion daemon.

#include "core/logging.h"
#include "core/signal.h"
#include "node/logging_init.h"
#include "node/options.h"
#include "node/service.h"

#include <cstdlib>
#include <iostream>
#include <utility>

int main(int argc, char* argv[]) {
    // Parse command-line arguments and the config file.
    auto parsed = node::parse_options(argc, argv);
    if (!parsed.ok()) {
        std::cerr << "Error: " << parsed.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    node::ServiceOptions options = std::move(parsed).value();

    if (options.show_help) {
        node::print_usage();
        return EXIT_SUCCESS;
    }
    if (options.show_version) {
        node::print_version();
        return EXIT_SUCCESS;
    }

    // Validate once; nothing downstream re-checks.
    auto validated = node::validate_options(options);
    if (!validated.ok()) {
        std::cerr << "Error: " << validated.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    node::ServiceSettings settings = std::move(validated).value();

    auto log_result = node::init_logging(options);
    if (!log_result.ok()) {
        std::cerr << "Error: " << log_result.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    LOG_INFO(core::LogCategory::NONE,
             node::get_startup_banner(options, settings));

    core::init_signal_handlers();

    node::Service service(std::move(options), std::move(settings));

    auto init_result = service.init();
    if (!init_result.ok()) {
        LOG_FATAL(core::LogCategory::NONE,
                  "Initialization failed: " + init_result.error().format());
        core::Logger::instance().flush();
        return EXIT_FAILURE;
    }

    // Run until shutdown signal (Ctrl+C / SIGTERM) or a fatal loop error.
    auto run_result = service.run();

    service.shutdown();

    if (!run_result.ok()) {
        std::cerr << "Error: " << run_result.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

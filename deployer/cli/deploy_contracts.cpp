/*
 * File:        deploy_contracts.cpp
 * Module:      deployer-cli
 * Purpose:     Command-line contract deployer
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "command_deploy.h"
#include "contract_id.h"
#include "errors.h"
#include "logging.h"

#include <iostream>
#include <string>

using namespace deployer;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n";
    std::cerr << "\n";
    std::cerr << "Deploy the HotShot and light client contracts, skipping any contract whose\n";
    std::cerr << "address is already known, and print the resulting addresses in .env format.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config FILE                  YAML configuration file\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Write logs to specified file\n";
    std::cerr << "  --variant VARIANT              Light client to deploy: production or mock\n";
    std::cerr << "                                 Default: mock\n";
    std::cerr << "  --only TARGET                  Deploy only hotshot, light-client or all\n";
    std::cerr << "                                 Default: all\n";
    std::cerr << "  --out FILE                     Write addresses to FILE instead of stdout\n";
    std::cerr << "  --simulate                     Deploy to an in-process simulated chain\n";
    std::cerr << "\n";
    std::cerr << "Predeployed contracts (also read from the environment variable in brackets):\n";
    for (auto id : all_contract_ids()) {
        std::string option = std::string("--") + contract_id_option_key(id);
        for (auto& c : option) {
            if (c == '_') c = '-';
        }
        std::cerr << "  " << option << " ADDRESS";
        for (size_t pad = option.size() + 8; pad < 33; ++pad) std::cerr << ' ';
        std::cerr << " [" << contract_id_name(id) << "]\n";
    }
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " --simulate\n";
    std::cerr << "  " << program_name << " --simulate --variant production --out contracts.env\n";
    std::cerr << "  " << program_name << " --simulate --plonk-verifier 0x5fbdb2315678afecb367f032d93f642f64180aa3\n";
}

int main(int argc, char* argv[]) {
    cli::DeployOptions options;
    std::string log_level = "info";
    std::string log_file;

    // Parse all arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
            options.log_level_set = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--variant" && i + 1 < argc) {
            std::string value = argv[++i];
            options.variant = deploy_variant_from_string(value);
            if (!options.variant) {
                std::cerr << "Error: Invalid variant: " << value << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--only" && i + 1 < argc) {
            std::string value = argv[++i];
            auto target = cli::deploy_target_from_string(value);
            if (!target) {
                std::cerr << "Error: Invalid target: " << value << "\n";
                print_usage(argv[0]);
                return 1;
            }
            options.target = *target;
        } else if (arg == "--out" && i + 1 < argc) {
            options.output_path = argv[++i];
        } else if (arg == "--simulate") {
            options.simulate = true;
        } else if (arg.rfind("--", 0) == 0 && contract_id_from_string(arg.substr(2)) && i + 1 < argc) {
            // Predeployed contract address
            auto id = *contract_id_from_string(arg.substr(2));
            std::string value = argv[++i];
            try {
                options.overrides.get(id) = Address::from_hex(value);
            } catch (const AddressParseError& e) {
                std::cerr << "Error: " << arg << ": " << e.what() << "\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Initialize logging
    deployer::init_logging(log_level, "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v", log_file);

    // Dispatch with exception handling
    try {
        return cli::deploy_command(options);
    } catch (const std::exception& e) {
        std::cerr << "\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}

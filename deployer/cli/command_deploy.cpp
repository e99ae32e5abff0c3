/*
 * File:        command_deploy.cpp
 * Module:      deployer-cli
 * Purpose:     Deploy contracts command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "command_deploy.h"
#include "address_cache.h"
#include "deployer.h"
#include "errors.h"
#include "light_client.h"
#include "logging.h"
#include "simulated_backend.h"

#include <iostream>
#include <memory>
#include <filesystem>

namespace fs = std::filesystem;

namespace deployer {
namespace cli {

std::optional<DeployTarget> deploy_target_from_string(const std::string& text) {
    if (text == "all") return DeployTarget::ALL;
    if (text == "hotshot") return DeployTarget::HOTSHOT;
    if (text == "light-client" || text == "light_client") return DeployTarget::LIGHT_CLIENT;
    return std::nullopt;
}

namespace {

bool export_addresses(const AddressCache& cache, const std::string& output_path) {
    try {
        if (output_path.empty()) {
            cache.write(std::cout);
        } else {
            cache.write_to_file(output_path);
        }
    } catch (const std::exception& e) {
        DEPLOYER_LOG_ERROR("Failed to export contract addresses: {}", e.what());
        return false;
    }
    return true;
}

} // anonymous namespace

int deploy_command(const DeployOptions& options) {
    if (!options.simulate) {
        DEPLOYER_LOG_ERROR("No chain backend is available in this build; use --simulate for a dry run");
        return 1;
    }

    DeploymentBackendPtr backend = std::make_unique<SimulatedBackend>();
    DEPLOYER_LOG_INFO("Using simulated backend");

    return deploy_command(options, *backend);
}

int deploy_command(const DeployOptions& options, DeploymentBackend& backend) {
    // Layered configuration: environment, then file, then command line
    DeployerConfig config;
    try {
        if (!options.config_path.empty()) {
            if (!fs::exists(options.config_path)) {
                DEPLOYER_LOG_ERROR("Config file not found: {}", options.config_path);
                return 1;
            }
            DEPLOYER_LOG_INFO("Loading config: {}", options.config_path);
            config = config_io::load_config(options.config_path);
        }

        DeployedContracts deployed = load_deployed_from_env();
        deployed.merge(config.contracts);
        deployed.merge(options.overrides);
        config.contracts = deployed;
    } catch (const ConfigError& e) {
        DEPLOYER_LOG_ERROR("Invalid configuration: {}", e.what());
        return 1;
    }

    if (!options.log_level_set && !config.log_level.empty()) {
        set_log_level(config.log_level);
    }

    DeployVariant variant = options.variant ? *options.variant
                          : config.variant  ? *config.variant
                                            : DeployVariant::MOCK;
    std::string output_path = !options.output_path.empty() ? options.output_path : config.output_path;

    AddressCache cache = AddressCache::from_deployed(config.contracts);
    DEPLOYER_LOG_INFO("{} contract(s) predeployed", cache.size());

    Deployer deployer(cache, backend);

    bool success = true;
    try {
        if (options.target == DeployTarget::ALL || options.target == DeployTarget::HOTSHOT) {
            deploy_hotshot_contract(deployer);
        }
        if (options.target == DeployTarget::ALL || options.target == DeployTarget::LIGHT_CLIENT) {
            DEPLOYER_LOG_INFO("Deploying {} light client", deploy_variant_to_string(variant));
            if (variant == DeployVariant::PRODUCTION) {
                deploy_light_client_contract(deployer);
                DEPLOYER_LOG_WARN("LightClient is upgradable: call initialize() through its proxy to finish setup");
            } else {
                deploy_mock_light_client_contract(deployer);
            }
        }
    } catch (const DeploymentError& e) {
        DEPLOYER_LOG_ERROR("Deployment failed: {}", e.what());
        success = false;
    } catch (const std::exception& e) {
        DEPLOYER_LOG_ERROR("Deployment aborted: {}", e.what());
        success = false;
    }

    // Addresses of contracts deployed before a failure are still exported
    if (!export_addresses(cache, output_path)) {
        return 1;
    }

    return success ? 0 : 1;
}

} // namespace cli
} // namespace deployer

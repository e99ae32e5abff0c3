/*
 * File:        command_deploy.h
 * Module:      deployer-cli
 * Purpose:     Deploy contracts command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "deployed_contracts.h"
#include "deployment_backend.h"
#include <optional>
#include <string>

namespace deployer {
namespace cli {

enum class DeployTarget {
    ALL,
    HOTSHOT,
    LIGHT_CLIENT
};

std::optional<DeployTarget> deploy_target_from_string(const std::string& text);

struct DeployOptions {
    std::string config_path;                 // Optional YAML configuration
    bool log_level_set = false;              // --log-level given on the command line
    std::optional<DeployVariant> variant;    // Overrides the configuration file
    DeployTarget target = DeployTarget::ALL;
    std::string output_path;                 // Overrides the configuration file; empty = stdout
    bool simulate = false;
    DeployedContracts overrides;             // Addresses given on the command line
};

/// Run with the simulated backend (requires options.simulate)
int deploy_command(const DeployOptions& options);

/**
 * @brief Run against a caller-supplied backend
 *
 * Predeployed addresses are layered environment, then configuration file,
 * then options.overrides. The address cache is exported even when a
 * deployment fails.
 *
 * @return 0 on success, 1 on configuration, deployment or export failure
 */
int deploy_command(const DeployOptions& options, DeploymentBackend& backend);

} // namespace cli
} // namespace deployer

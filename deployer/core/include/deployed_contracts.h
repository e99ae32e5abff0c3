/*
 * File:        deployed_contracts.h
 * Module:      deployer-core
 * Purpose:     Deployer configuration and predeployed contract addresses
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "address.h"
#include "contract_id.h"
#include <functional>
#include <optional>
#include <string>

namespace deployer {

/**
 * @brief Set of predeployed contracts
 *
 * One optional address per contract. A present value seeds the address
 * cache, so that contract (and everything its deployment would have
 * deployed first) is skipped for the run.
 */
struct DeployedContracts {
    std::optional<Address> hotshot;                       // HotShot.sol
    std::optional<Address> plonk_verifier;                // PlonkVerifier.sol
    std::optional<Address> light_client_state_update_vk;  // LightClientStateUpdateVK.sol
    std::optional<Address> light_client;                  // LightClient.sol
    std::optional<Address> light_client_proxy;            // LightClient.sol proxy

    const std::optional<Address>& get(ContractId id) const;
    std::optional<Address>& get(ContractId id);

    /// Take every present value of `overrides`
    void merge(const DeployedContracts& overrides);
};

/**
 * @brief Which light client build to deploy
 */
enum class DeployVariant {
    PRODUCTION,  // Upgradable LightClient, caller initializes through the proxy
    MOCK         // LightClientMock, initialized by its constructor
};

const char* deploy_variant_to_string(DeployVariant variant);
std::optional<DeployVariant> deploy_variant_from_string(const std::string& text);

/**
 * @brief Contents of a deployer configuration file
 *
 * ```yaml
 * deployer:
 *   log_level: info
 *   variant: mock
 *   output: contracts.env
 * contracts:
 *   ESPRESSO_SEQUENCER_PLONK_VERIFIER_ADDRESS: "0x..."
 *   light_client_state_update_vk: "0x..."
 * ```
 */
struct DeployerConfig {
    std::string log_level;                 // Empty if not set
    std::optional<DeployVariant> variant;
    std::string output_path;               // Empty means stdout
    DeployedContracts contracts;
};

using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Read predeployed addresses from the process environment
 *
 * Each contract is read from the variable named by its display name.
 * Empty values are ignored.
 *
 * @throws AddressParseError if a non-empty value is not an address
 */
DeployedContracts load_deployed_from_env();

/// Same as above with an injectable variable lookup
DeployedContracts load_deployed_from_env(const EnvLookup& lookup);

namespace config_io {

/**
 * @brief Load a YAML configuration file
 * @throws ConfigError on unreadable YAML, unknown keys or bad values
 */
DeployerConfig load_config(const std::string& filename);

/// Parse configuration from YAML text
DeployerConfig parse_config(const std::string& yaml_text, const std::string& source_name = "<string>");

} // namespace config_io
} // namespace deployer

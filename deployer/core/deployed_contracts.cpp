/*
 * File:        deployed_contracts.cpp
 * Module:      deployer-core
 * Purpose:     Configuration loading (environment and YAML)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "deployed_contracts.h"
#include "errors.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace deployer {

const std::optional<Address>& DeployedContracts::get(ContractId id) const {
    switch (id) {
        case ContractId::HotShot:          return hotshot;
        case ContractId::PlonkVerifier:    return plonk_verifier;
        case ContractId::StateUpdateVK:    return light_client_state_update_vk;
        case ContractId::LightClient:      return light_client;
        case ContractId::LightClientProxy: return light_client_proxy;
    }
    throw std::invalid_argument("unknown contract id");
}

std::optional<Address>& DeployedContracts::get(ContractId id) {
    const auto& self = *this;
    return const_cast<std::optional<Address>&>(self.get(id));
}

void DeployedContracts::merge(const DeployedContracts& overrides) {
    for (auto id : all_contract_ids()) {
        if (overrides.get(id)) {
            get(id) = overrides.get(id);
        }
    }
}

const char* deploy_variant_to_string(DeployVariant variant) {
    switch (variant) {
        case DeployVariant::PRODUCTION: return "production";
        case DeployVariant::MOCK:       return "mock";
    }
    return "unknown";
}

std::optional<DeployVariant> deploy_variant_from_string(const std::string& text) {
    if (text == "production") return DeployVariant::PRODUCTION;
    if (text == "mock") return DeployVariant::MOCK;
    return std::nullopt;
}

DeployedContracts load_deployed_from_env() {
    return load_deployed_from_env([](const char* name) -> const char* { return std::getenv(name); });
}

DeployedContracts load_deployed_from_env(const EnvLookup& lookup) {
    DeployedContracts deployed;
    for (auto id : all_contract_ids()) {
        const char* value = lookup(contract_id_name(id));
        if (value == nullptr || *value == '\0') {
            continue;
        }
        try {
            deployed.get(id) = Address::from_hex(value);
        } catch (const AddressParseError& e) {
            throw AddressParseError(std::string("environment variable ") + contract_id_name(id) + ": " + e.what());
        }
        DEPLOYER_LOG_DEBUG("Predeployed {} from environment", id);
    }
    return deployed;
}

namespace config_io {

namespace {

DeployerConfig parse_root(const YAML::Node& root, const std::string& source) {
    DeployerConfig config;

    // An empty document is a valid, empty configuration
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Invalid config file '" + source + "': top level must be a mapping");
    }

    for (const auto& section : root) {
        std::string name = section.first.as<std::string>();
        if (name != "deployer" && name != "contracts") {
            throw ConfigError("Invalid config file '" + source + "': unknown section '" + name + "'");
        }
    }

    if (root["deployer"]) {
        const YAML::Node settings = root["deployer"];
        if (!settings.IsNull() && !settings.IsMap()) {
            throw ConfigError("Invalid config file '" + source + "': 'deployer' must be a mapping");
        }
        for (const auto& entry : settings) {
            std::string key = entry.first.as<std::string>();
            if (key != "log_level" && key != "variant" && key != "output") {
                throw ConfigError("Invalid config file '" + source + "': unknown deployer setting '" + key +
                                  "'. Valid settings are: log_level, variant, output");
            }
        }

        config.log_level = settings["log_level"].as<std::string>("");
        config.output_path = settings["output"].as<std::string>("");

        if (settings["variant"]) {
            std::string variant = settings["variant"].as<std::string>();
            config.variant = deploy_variant_from_string(variant);
            if (!config.variant) {
                throw ConfigError("Invalid config file '" + source + "': invalid variant '" + variant +
                                  "'. Valid values are: production, mock");
            }
        }
    }

    if (root["contracts"]) {
        const YAML::Node contracts = root["contracts"];
        if (!contracts.IsMap()) {
            throw ConfigError("Invalid config file '" + source + "': 'contracts' must be a mapping");
        }

        for (const auto& entry : contracts) {
            std::string key = entry.first.as<std::string>();
            auto id = contract_id_from_string(key);
            if (!id) {
                throw ConfigError("Invalid config file '" + source + "': unknown contract '" + key + "'");
            }

            std::string value = entry.second.as<std::string>("");
            if (value.empty()) {
                continue;
            }

            try {
                config.contracts.get(*id) = Address::from_hex(value);
            } catch (const AddressParseError& e) {
                throw AddressParseError("Invalid config file '" + source + "': " + key + ": " + e.what());
            }
        }
    }

    return config;
}

} // anonymous namespace

DeployerConfig load_config(const std::string& filename) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + filename + "': " + e.what());
    }

    try {
        return parse_root(root, filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid config file '" + filename + "': " + e.what());
    }
}

DeployerConfig parse_config(const std::string& yaml_text, const std::string& source_name) {
    YAML::Node root;

    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML '" + source_name + "': " + e.what());
    }

    try {
        return parse_root(root, source_name);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid config '" + source_name + "': " + e.what());
    }
}

} // namespace config_io
} // namespace deployer

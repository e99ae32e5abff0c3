/*
 * File:        contract_id.h
 * Module:      deployer-core
 * Purpose:     Identifiers for the contracts managed by a deployment run
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace deployer {

/**
 * @brief Role of a contract in the deployment
 *
 * Closed set. Each identifier has a fixed display name, which is also the
 * environment variable used to supply a predeployed address and the key
 * written to the exported .env file.
 */
enum class ContractId {
    HotShot,
    PlonkVerifier,
    StateUpdateVK,
    LightClient,
    LightClientProxy
};

/// Display name, e.g. "ESPRESSO_SEQUENCER_PLONK_VERIFIER_ADDRESS"
const char* contract_id_name(ContractId id);

/// Short option key, e.g. "plonk_verifier"
const char* contract_id_option_key(ContractId id);

/// All identifiers in declaration order
const std::vector<ContractId>& all_contract_ids();

/**
 * @brief Look up an identifier by display name or option key
 *
 * Option keys are also accepted with '-' in place of '_'.
 *
 * @return The identifier, or std::nullopt if the text names no contract
 */
std::optional<ContractId> contract_id_from_string(const std::string& text);

inline std::string to_string(ContractId id) {
    return contract_id_name(id);
}

} // namespace deployer

// fmt formatter for ContractId
template <>
struct fmt::formatter<deployer::ContractId> : fmt::formatter<fmt::string_view> {
    auto format(deployer::ContractId id, format_context& ctx) const {
        return fmt::formatter<fmt::string_view>::format(deployer::contract_id_name(id), ctx);
    }
};

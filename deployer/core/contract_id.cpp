/*
 * File:        contract_id.cpp
 * Module:      deployer-core
 * Purpose:     ContractId names
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "contract_id.h"
#include <algorithm>

namespace deployer {

const char* contract_id_name(ContractId id) {
    switch (id) {
        case ContractId::HotShot:          return "ESPRESSO_SEQUENCER_HOTSHOT_ADDRESS";
        case ContractId::PlonkVerifier:    return "ESPRESSO_SEQUENCER_PLONK_VERIFIER_ADDRESS";
        case ContractId::StateUpdateVK:    return "ESPRESSO_SEQUENCER_LIGHT_CLIENT_STATE_UPDATE_VK_ADDRESS";
        case ContractId::LightClient:      return "ESPRESSO_SEQUENCER_LIGHT_CLIENT_ADDRESS";
        case ContractId::LightClientProxy: return "ESPRESSO_SEQUENCER_LIGHT_CLIENT_PROXY_ADDRESS";
    }
    return "UNKNOWN";
}

const char* contract_id_option_key(ContractId id) {
    switch (id) {
        case ContractId::HotShot:          return "hotshot";
        case ContractId::PlonkVerifier:    return "plonk_verifier";
        case ContractId::StateUpdateVK:    return "light_client_state_update_vk";
        case ContractId::LightClient:      return "light_client";
        case ContractId::LightClientProxy: return "light_client_proxy";
    }
    return "unknown";
}

const std::vector<ContractId>& all_contract_ids() {
    static const std::vector<ContractId> ids = {
        ContractId::HotShot,
        ContractId::PlonkVerifier,
        ContractId::StateUpdateVK,
        ContractId::LightClient,
        ContractId::LightClientProxy,
    };
    return ids;
}

std::optional<ContractId> contract_id_from_string(const std::string& text) {
    std::string key = text;
    std::replace(key.begin(), key.end(), '-', '_');

    for (auto id : all_contract_ids()) {
        if (text == contract_id_name(id) || key == contract_id_option_key(id)) {
            return id;
        }
    }
    return std::nullopt;
}

} // namespace deployer

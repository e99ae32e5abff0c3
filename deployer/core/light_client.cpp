/*
 * File:        light_client.cpp
 * Module:      deployer-core
 * Purpose:     Deployment procedures for the light client and HotShot contracts
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "light_client.h"
#include "bytecode_linker.h"
#include "embedded_artifacts.h"
#include "logging.h"

namespace deployer {

LightClientState LightClientState::dummy_genesis() {
    LightClientState state;
    state.view_num = 0;
    state.block_height = 0;
    state.block_comm_root = Word256::from_uint64(0);
    state.fee_ledger_comm = Word256::from_uint64(0);
    state.stake_table_bls_key_comm = Word256::from_uint64(123);
    state.stake_table_schnorr_key_comm = Word256::from_uint64(123);
    state.stake_table_amount_comm = Word256::from_uint64(20);
    state.threshold = Word256::from_uint64(1);
    return state;
}

std::vector<Word256> LightClientState::to_abi_words() const {
    return {
        Word256::from_uint64(view_num),
        Word256::from_uint64(block_height),
        block_comm_root,
        fee_ledger_comm,
        stake_table_bls_key_comm,
        stake_table_schnorr_key_comm,
        stake_table_amount_comm,
        threshold,
    };
}

bool LightClientState::operator==(const LightClientState& other) const {
    return to_abi_words() == other.to_abi_words();
}

MockLightClientArgs default_mock_light_client_args() {
    MockLightClientArgs args;
    args.genesis = LightClientState::dummy_genesis();
    args.num_blocks_per_epoch = std::numeric_limits<uint32_t>::max();
    return args;
}

std::vector<uint8_t> encode_constructor_args(const MockLightClientArgs& args) {
    auto words = args.genesis.to_abi_words();
    words.push_back(Word256::from_uint64(args.num_blocks_per_epoch));
    return abi::encode(words);
}

namespace {

/**
 * @brief What differs between the production and mock light client
 */
struct LightClientVariant {
    const char* template_name;        // Embedded LightClient template
    const char* vk_artifact;          // Embedded verification key library
    const char* vk_library;           // Qualified name of the key library
};

const LightClientVariant PRODUCTION_VARIANT = {
    artifact_names::LIGHT_CLIENT,
    artifact_names::STATE_UPDATE_VK,
    library_names::STATE_UPDATE_VK,
};

const LightClientVariant MOCK_VARIANT = {
    artifact_names::LIGHT_CLIENT_MOCK,
    artifact_names::STATE_UPDATE_VK_MOCK,
    library_names::STATE_UPDATE_VK_MOCK,
};

// Creation transaction for a template without library references
PreparedDeployment prepare_plain(const char* artifact_name) {
    const auto& artifact = EmbeddedArtifacts::instance().load(artifact_name);
    return prepare_deployment(bytecode_linker::assert_fully_linked(artifact));
}

Address deploy_linked_light_client(Deployer& deployer,
                                   const LightClientVariant& variant,
                                   const std::vector<uint8_t>& constructor_args) {
    return deployer.deploy_fn(ContractId::LightClient, [&](Deployer& d) {
        // Deploy library contracts
        Address plonk_verifier = d.deploy_tx(ContractId::PlonkVerifier,
                                             prepare_plain(artifact_names::PLONK_VERIFIER));
        Address vk = d.deploy_tx(ContractId::StateUpdateVK, prepare_plain(variant.vk_artifact));

        // Link with the light client template. The unlinked bytecode is
        // compiled into this binary, so contract artifacts do not have to be
        // distributed with it.
        const auto& unlinked = EmbeddedArtifacts::instance().load(variant.template_name);
        auto linked = bytecode_linker::link_library(unlinked, library_names::PLONK_VERIFIER, plonk_verifier);
        linked = bytecode_linker::link_library(linked, variant.vk_library, vk);
        auto resolved = bytecode_linker::assert_fully_linked(linked);

        return d.broadcast(prepare_deployment(resolved, constructor_args));
    });
}

} // anonymous namespace

Address deploy_light_client_contract(Deployer& deployer) {
    return deploy_linked_light_client(deployer, PRODUCTION_VARIANT, {});
}

Address deploy_mock_light_client_contract(Deployer& deployer,
                                          const std::optional<MockLightClientArgs>& args) {
    MockLightClientArgs constructor_args = args ? *args : default_mock_light_client_args();
    if (!args) {
        DEPLOYER_LOG_DEBUG("Using default LightClientMock constructor arguments (dummy genesis, {} blocks per epoch)",
                           constructor_args.num_blocks_per_epoch);
    }
    return deploy_linked_light_client(deployer, MOCK_VARIANT, encode_constructor_args(constructor_args));
}

Address deploy_hotshot_contract(Deployer& deployer) {
    return deployer.deploy_tx(ContractId::HotShot, prepare_plain(artifact_names::HOTSHOT));
}

} // namespace deployer

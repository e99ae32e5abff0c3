/*
 * File:        light_client.h
 * Module:      deployer-core
 * Purpose:     Deployment procedures for the light client and HotShot contracts
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "abi.h"
#include "deployer.h"
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace deployer {

/// Fully qualified names of the libraries linked into the light client
namespace library_names {
    constexpr const char* PLONK_VERIFIER =
        "contracts/src/libraries/PlonkVerifier.sol:PlonkVerifier";
    constexpr const char* STATE_UPDATE_VK =
        "contracts/src/libraries/LightClientStateUpdateVK.sol:LightClientStateUpdateVK";
    constexpr const char* STATE_UPDATE_VK_MOCK =
        "contracts/tests/mocks/LightClientStateUpdateVKMock.sol:LightClientStateUpdateVKMock";
}

/**
 * @brief Light client state as passed to the contract constructor
 *
 * ABI layout: (uint64, uint64, uint256 x 6), all static, one word each.
 */
struct LightClientState {
    uint64_t view_num = 0;
    uint64_t block_height = 0;
    Word256 block_comm_root;
    Word256 fee_ledger_comm;
    Word256 stake_table_bls_key_comm;
    Word256 stake_table_schnorr_key_comm;
    Word256 stake_table_amount_comm;
    Word256 threshold;

    /// Fixed genesis used when no constructor arguments are supplied
    static LightClientState dummy_genesis();

    std::vector<Word256> to_abi_words() const;

    bool operator==(const LightClientState& other) const;
    bool operator!=(const LightClientState& other) const { return !(*this == other); }
};

/**
 * @brief Constructor arguments of LightClientMock
 */
struct MockLightClientArgs {
    LightClientState genesis;
    uint32_t num_blocks_per_epoch = std::numeric_limits<uint32_t>::max();  // MAX disables epochs
};

/// Defaults used when the caller supplies no arguments
MockLightClientArgs default_mock_light_client_args();

/// ABI encoding of (LightClientState genesis, uint32 numBlocksPerEpoch)
std::vector<uint8_t> encode_constructor_args(const MockLightClientArgs& args);

/**
 * @brief Deploy LightClient.sol (production)
 *
 * Deploys PlonkVerifier and LightClientStateUpdateVK first, links them into
 * the embedded LightClient template and broadcasts it with no constructor
 * arguments.
 *
 * LightClient is upgradable: its constructor is disabled, so the caller
 * must follow up with an initialize() call (genesis state and epoch length)
 * delegated through the proxy contract.
 *
 * The whole procedure runs under the LightClient identifier: if the cache
 * already knows LightClient, nothing is deployed.
 */
Address deploy_light_client_contract(Deployer& deployer);

/**
 * @brief Deploy LightClientMock.sol (testing)
 *
 * Same as deploy_light_client_contract but links the mock verification key
 * library (cached under the same StateUpdateVK identifier) and is not
 * upgradable: its constructor initializes the contract, so no follow-up
 * call is needed.
 *
 * @param args Constructor arguments; defaults to the dummy genesis and
 *             an epoch length of UINT32_MAX
 */
Address deploy_mock_light_client_contract(Deployer& deployer,
                                          const std::optional<MockLightClientArgs>& args = std::nullopt);

/**
 * @brief Deploy HotShot.sol (no libraries, no constructor arguments)
 */
Address deploy_hotshot_contract(Deployer& deployer);

} // namespace deployer

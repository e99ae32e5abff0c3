/*
 * File:        deployment_backend.h
 * Module:      deployer-core
 * Purpose:     Interface to the chain that contracts are deployed on
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "address.h"
#include "bytecode.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace deployer {

/**
 * @brief Outcome of a confirmed call transaction
 */
struct Receipt {
    std::string transaction_hash;
    uint64_t block_number = 0;
    bool success = false;
};

/**
 * @brief A creation transaction ready to broadcast
 */
struct PreparedDeployment {
    std::string contract_name;               // For logging only
    std::vector<uint8_t> code;               // Fully linked creation image
    std::vector<uint8_t> constructor_args;   // ABI-encoded, appended to code
};

/// Build a creation transaction from a linked image
PreparedDeployment prepare_deployment(const ResolvedArtifact& artifact,
                                      std::vector<uint8_t> constructor_args = {});

/**
 * @brief Chain access used by the orchestrator
 *
 * Implementations block until the transaction is confirmed. Failures
 * (network, validation, confirmation) are reported by throwing BackendError.
 */
class DeploymentBackend {
public:
    virtual ~DeploymentBackend() = default;

    /**
     * @brief Broadcast a creation transaction and wait for confirmation
     * @return Address of the new contract
     * @throws BackendError on failure
     */
    virtual Address create_contract(const std::vector<uint8_t>& code,
                                    const std::vector<uint8_t>& constructor_args) = 0;

    /**
     * @brief Send a call transaction (e.g. initialize() through a proxy)
     *
     * Not used by the orchestrator; available to callers that must
     * initialize upgradable contracts after deployment.
     *
     * @throws BackendError on failure
     */
    virtual Receipt send_transaction(const Address& to, const std::vector<uint8_t>& payload) = 0;
};

using DeploymentBackendPtr = std::unique_ptr<DeploymentBackend>;

} // namespace deployer

/*
 * File:        deployer.h
 * Module:      deployer-core
 * Purpose:     Memoized, dependency-ordered contract deployment
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "address_cache.h"
#include "deployment_backend.h"
#include <functional>

namespace deployer {

/**
 * @brief Deploys each contract at most once per run
 *
 * A deployment is a procedure keyed by ContractId. The procedure only runs
 * when the cache has no address for the identifier; its result is recorded
 * immediately after it returns. Procedures receive this Deployer, so they
 * can deploy the contracts they depend on first, through the same cache.
 *
 * Nested calls complete before the calling procedure continues, so only one
 * deployment holds the cache at any time. There is no cycle detection: a
 * procedure that (indirectly) deploys its own identifier recurses without
 * bound.
 *
 * Thread safety: Not thread-safe.
 */
class Deployer {
public:
    using Procedure = std::function<Address(Deployer&)>;

    Deployer(AddressCache& cache, DeploymentBackend& backend);

    // Holds references to the run's cache and backend
    Deployer(const Deployer&) = delete;
    Deployer& operator=(const Deployer&) = delete;

    /**
     * @brief Deploy a contract by calling a procedure
     *
     * Returns the cached address without calling the procedure if `id` is
     * already known. Otherwise runs the procedure and records its result.
     * Nothing is recorded for `id` if the procedure fails; addresses the
     * procedure recorded for other contracts before failing are kept.
     *
     * @throws DeploymentError naming `id`, or the nested contract that failed
     */
    Address deploy_fn(ContractId id, const Procedure& procedure);

    /**
     * @brief Deploy a contract by broadcasting a prepared creation transaction
     *
     * The transaction is only broadcast if `id` is not already known.
     */
    Address deploy_tx(ContractId id, const PreparedDeployment& tx);

    /**
     * @brief Broadcast a creation transaction without touching the cache
     *
     * The primitive behind deploy_tx, for procedures that build their final
     * transaction from the addresses of their dependencies.
     */
    Address broadcast(const PreparedDeployment& tx);

    AddressCache& cache() { return cache_; }
    const AddressCache& cache() const { return cache_; }

    DeploymentBackend& backend() { return backend_; }

private:
    AddressCache& cache_;
    DeploymentBackend& backend_;
};

} // namespace deployer

/*
 * File:        deployer.cpp
 * Module:      deployer-core
 * Purpose:     Memoized, dependency-ordered contract deployment
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "deployer.h"
#include "errors.h"
#include "logging.h"

namespace deployer {

Deployer::Deployer(AddressCache& cache, DeploymentBackend& backend)
    : cache_(cache)
    , backend_(backend)
{
}

Address Deployer::deploy_fn(ContractId id, const Procedure& procedure) {
    if (auto existing = cache_.lookup(id)) {
        DEPLOYER_LOG_INFO("skipping deployment of {}, already deployed at {}", id, *existing);
        return *existing;
    }

    DEPLOYER_LOG_INFO("deploying {}", id);

    Address address;
    try {
        address = procedure(*this);
    } catch (const DeploymentError&) {
        // A dependency failed; it already names itself
        throw;
    } catch (const LinkingError& e) {
        DEPLOYER_LOG_ERROR("{}: {}", id, e.what());
        throw DeploymentError(id, ErrorCause::LINKING, e.what());
    } catch (const ArtifactLoadError& e) {
        DEPLOYER_LOG_CRITICAL("{}: {}", id, e.what());
        throw DeploymentError(id, ErrorCause::ARTIFACT_LOAD, e.what());
    } catch (const BackendError& e) {
        DEPLOYER_LOG_ERROR("{}: creation transaction failed: {}", id, e.what());
        throw DeploymentError(id, ErrorCause::BACKEND, e.what());
    } catch (const std::exception& e) {
        DEPLOYER_LOG_ERROR("{}: {}", id, e.what());
        throw DeploymentError(id, ErrorCause::OTHER, e.what());
    }

    DEPLOYER_LOG_INFO("deployed {} at {}", id, address);
    cache_.record(id, address);
    return address;
}

Address Deployer::deploy_tx(ContractId id, const PreparedDeployment& tx) {
    return deploy_fn(id, [&tx](Deployer& self) {
        return self.broadcast(tx);
    });
}

Address Deployer::broadcast(const PreparedDeployment& tx) {
    DEPLOYER_LOG_DEBUG("Broadcasting creation of {} ({} code bytes, {} argument bytes)",
                       tx.contract_name, tx.code.size(), tx.constructor_args.size());
    return backend_.create_contract(tx.code, tx.constructor_args);
}

} // namespace deployer

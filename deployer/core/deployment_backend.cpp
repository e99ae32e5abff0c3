/*
 * File:        deployment_backend.cpp
 * Module:      deployer-core
 * Purpose:     Creation transaction preparation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "deployment_backend.h"

namespace deployer {

PreparedDeployment prepare_deployment(const ResolvedArtifact& artifact,
                                      std::vector<uint8_t> constructor_args) {
    PreparedDeployment tx;
    tx.contract_name = artifact.name();
    tx.code = artifact.bytes();
    tx.constructor_args = std::move(constructor_args);
    return tx;
}

} // namespace deployer

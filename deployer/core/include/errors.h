/*
 * File:        errors.h
 * Module:      deployer-core
 * Purpose:     Error categories and exception types
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "contract_id.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace deployer {

/**
 * @brief Underlying cause of a failed deployment
 */
enum class ErrorCause : int32_t {
    BACKEND = 1,        // Creation transaction failed (network, validation, confirmation)
    LINKING = 2,        // Unresolved library reference in a creation image
    ARTIFACT_LOAD = 3,  // Embedded template is malformed (build defect)
    OTHER = 99
};

const char* error_cause_to_string(ErrorCause cause);

/**
 * @brief Exception thrown for invalid configuration input
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Exception thrown when address text is not 20 hex-encoded bytes
 */
class AddressParseError : public ConfigError {
public:
    explicit AddressParseError(const std::string& msg) : ConfigError(msg) {}
};

/**
 * @brief Exception thrown when an embedded bytecode template cannot be parsed
 *
 * Templates are compiled in, so this indicates a build defect rather than a
 * runtime condition.
 */
class ArtifactLoadError : public std::runtime_error {
public:
    ArtifactLoadError(std::string resource, const std::string& msg)
        : std::runtime_error("artifact '" + resource + "': " + msg)
        , resource_(std::move(resource)) {}

    const std::string& resource() const { return resource_; }

private:
    std::string resource_;
};

/**
 * @brief Exception thrown when a library reference remains unresolved
 */
class LinkingError : public std::runtime_error {
public:
    LinkingError(std::string artifact, std::string reference, const std::string& msg)
        : std::runtime_error(msg)
        , artifact_(std::move(artifact))
        , reference_(std::move(reference)) {}

    const std::string& artifact() const { return artifact_; }
    const std::string& reference() const { return reference_; }

private:
    std::string artifact_;
    std::string reference_;
};

/**
 * @brief Exception thrown by deployment backends when a transaction fails
 */
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Exception surfaced by the orchestrator for a failed deployment
 *
 * Names the contract whose deployment failed and the category of the cause.
 */
class DeploymentError : public std::runtime_error {
public:
    DeploymentError(ContractId contract, ErrorCause cause, const std::string& detail)
        : std::runtime_error(fmt::format("failed to deploy {} ({}): {}",
                                         contract, error_cause_to_string(cause), detail))
        , contract_(contract)
        , cause_(cause)
        , detail_(detail) {}

    ContractId contract() const { return contract_; }
    ErrorCause cause() const { return cause_; }
    const std::string& detail() const { return detail_; }

private:
    ContractId contract_;
    ErrorCause cause_;
    std::string detail_;
};

} // namespace deployer

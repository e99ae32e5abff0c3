/*
 * File:        simulated_backend.h
 * Module:      deployer-core
 * Purpose:     In-process deployment backend for dry runs and tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "deployment_backend.h"
#include <optional>
#include <set>

namespace deployer {

/**
 * @brief Backend that "deploys" without a chain
 *
 * Contract addresses are the base address plus the 1-based creation
 * number, so a run is reproducible. Every call is recorded.
 *
 * Failures can be injected per creation number (0-based, counted over all
 * attempts including failed ones).
 */
class SimulatedBackend : public DeploymentBackend {
public:
    struct Creation {
        std::vector<uint8_t> code;
        std::vector<uint8_t> constructor_args;
        Address address;
    };

    struct Call {
        Address to;
        std::vector<uint8_t> payload;
    };

    SimulatedBackend();
    explicit SimulatedBackend(const Address& base);

    Address create_contract(const std::vector<uint8_t>& code,
                            const std::vector<uint8_t>& constructor_args) override;

    Receipt send_transaction(const Address& to, const std::vector<uint8_t>& payload) override;

    /// Make the creation attempt with this 0-based number fail
    void fail_creation(size_t attempt) { failing_attempts_.insert(attempt); }

    /// Successful creations, in order
    const std::vector<Creation>& creations() const { return creations_; }
    size_t creation_count() const { return creations_.size(); }

    /// Creation attempts including failed ones
    size_t attempt_count() const { return attempts_; }

    const std::vector<Call>& calls() const { return calls_; }

    /// Address the next successful creation would get
    Address next_address() const;

private:
    Address base_;
    size_t attempts_ = 0;
    std::set<size_t> failing_attempts_;
    std::vector<Creation> creations_;
    std::vector<Call> calls_;
};

} // namespace deployer

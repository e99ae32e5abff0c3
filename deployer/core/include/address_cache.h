/*
 * File:        address_cache.h
 * Module:      deployer-core
 * Purpose:     Cache of contract addresses known to a deployment run
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "address.h"
#include "contract_id.h"
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace deployer {

struct DeployedContracts;

/**
 * @brief Addresses predeployed or deployed during the current run
 *
 * Seeded from caller-supplied addresses, grown by the orchestrator after
 * each successful deployment and exported once at the end of the run.
 *
 * Entries are ordered by ContractId so that export is deterministic.
 *
 * Thread safety: Not thread-safe. Owned by the single control flow of a run.
 */
class AddressCache {
public:
    AddressCache() = default;

    /// Seed a cache from every present field of a predeployed set
    static AddressCache from_deployed(const DeployedContracts& deployed);

    std::optional<Address> lookup(ContractId id) const;

    /**
     * @brief Insert or overwrite the entry for an identifier
     *
     * The orchestrator calls this once per identifier, right after the
     * deployment succeeded.
     */
    void record(ContractId id, const Address& address);

    bool contains(ContractId id) const { return entries_.count(id) != 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<std::pair<ContractId, Address>> entries() const;

    /**
     * @brief Write one "<NAME>=<0x address>" line per entry (.env format)
     * @throws std::runtime_error if the stream fails
     */
    void write(std::ostream& out) const;

    /// Write the .env export to a file, replacing its contents
    void write_to_file(const std::string& path) const;

private:
    std::map<ContractId, Address> entries_;
};

} // namespace deployer

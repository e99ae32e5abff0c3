/*
 * File:        address_cache.cpp
 * Module:      deployer-core
 * Purpose:     Address cache implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "address_cache.h"
#include "deployed_contracts.h"
#include "logging.h"
#include <fstream>
#include <stdexcept>

namespace deployer {

AddressCache AddressCache::from_deployed(const DeployedContracts& deployed) {
    AddressCache cache;
    for (auto id : all_contract_ids()) {
        const auto& address = deployed.get(id);
        if (address) {
            DEPLOYER_LOG_DEBUG("Using predeployed {} at {}", id, *address);
            cache.record(id, *address);
        }
    }
    return cache;
}

std::optional<Address> AddressCache::lookup(ContractId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AddressCache::record(ContractId id, const Address& address) {
    entries_[id] = address;
}

std::vector<std::pair<ContractId, Address>> AddressCache::entries() const {
    return {entries_.begin(), entries_.end()};
}

void AddressCache::write(std::ostream& out) const {
    for (const auto& [id, address] : entries_) {
        out << contract_id_name(id) << '=' << address.to_hex() << '\n';
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("failed to write contract addresses");
    }
}

void AddressCache::write_to_file(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    write(file);
    DEPLOYER_LOG_INFO("Wrote {} contract addresses to {}", entries_.size(), path);
}

} // namespace deployer

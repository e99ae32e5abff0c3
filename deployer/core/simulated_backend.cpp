/*
 * File:        simulated_backend.cpp
 * Module:      deployer-core
 * Purpose:     In-process deployment backend
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "simulated_backend.h"
#include "errors.h"
#include "logging.h"

namespace deployer {

namespace {

const char* DEFAULT_BASE = "0x1000000000000000000000000000000000000000";

// Add a small value to the low-order bytes of an address
Address offset_address(const Address& base, uint64_t offset) {
    auto bytes = base.bytes();
    uint64_t carry = offset;
    for (size_t i = Address::SIZE; i-- > 0 && carry != 0;) {
        uint64_t sum = bytes[i] + (carry & 0xff);
        bytes[i] = static_cast<uint8_t>(sum);
        carry = (carry >> 8) + (sum >> 8);
    }
    return Address(bytes);
}

} // anonymous namespace

SimulatedBackend::SimulatedBackend()
    : base_(Address::from_hex(DEFAULT_BASE)) {}

SimulatedBackend::SimulatedBackend(const Address& base)
    : base_(base) {}

Address SimulatedBackend::next_address() const {
    return offset_address(base_, creations_.size() + 1);
}

Address SimulatedBackend::create_contract(const std::vector<uint8_t>& code,
                                          const std::vector<uint8_t>& constructor_args) {
    size_t attempt = attempts_++;
    if (failing_attempts_.count(attempt) != 0) {
        throw BackendError("simulated failure of creation transaction #" + std::to_string(attempt));
    }
    if (code.empty()) {
        throw BackendError("creation transaction has no code");
    }

    Creation creation{code, constructor_args, next_address()};
    DEPLOYER_LOG_DEBUG("Simulated creation #{}: {} code bytes, {} argument bytes -> {}",
                       attempt, code.size(), constructor_args.size(), creation.address);
    creations_.push_back(std::move(creation));
    return creations_.back().address;
}

Receipt SimulatedBackend::send_transaction(const Address& to, const std::vector<uint8_t>& payload) {
    calls_.push_back(Call{to, payload});

    Receipt receipt;
    receipt.transaction_hash = fmt::format("0x{:064x}", calls_.size());
    receipt.block_number = creations_.size() + calls_.size();
    receipt.success = true;
    return receipt;
}

} // namespace deployer

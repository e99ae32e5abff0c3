/*
 * File:        abi.cpp
 * Module:      deployer-core
 * Purpose:     ABI word encoding
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "abi.h"
#include <algorithm>

namespace deployer {

Word256 Word256::from_uint64(uint64_t value) {
    bytes_type bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return Word256(bytes);
}

Word256 Word256::from_address(const Address& address) {
    bytes_type bytes{};
    std::copy(address.bytes().begin(), address.bytes().end(), bytes.begin() + (SIZE - Address::SIZE));
    return Word256(bytes);
}

namespace abi {

std::vector<uint8_t> encode(const std::vector<Word256>& words) {
    std::vector<uint8_t> out;
    out.reserve(words.size() * Word256::SIZE);
    for (const auto& word : words) {
        out.insert(out.end(), word.bytes().begin(), word.bytes().end());
    }
    return out;
}

} // namespace abi
} // namespace deployer

/*
 * File:        address.cpp
 * Module:      deployer-core
 * Purpose:     Address parsing and formatting
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "address.h"
#include "errors.h"
#include "hex.h"
#include <algorithm>

namespace deployer {

Address Address::from_hex(const std::string& text) {
    std::string digits = hex::strip_prefix(text);
    if (digits.size() != SIZE * 2) {
        throw AddressParseError("invalid address '" + text + "': expected 40 hex digits, got " +
                                std::to_string(digits.size()));
    }

    auto decoded = hex::decode(digits);
    if (!decoded || decoded->size() != SIZE) {
        throw AddressParseError("invalid address '" + text + "': not a hex string");
    }

    bytes_type bytes{};
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return Address(bytes);
}

std::string Address::to_hex() const {
    return "0x" + hex::encode(bytes_.data(), bytes_.size());
}

bool Address::is_zero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

} // namespace deployer

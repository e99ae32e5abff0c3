/*
 * File:        abi.h
 * Module:      deployer-core
 * Purpose:     ABI words and static tuple encoding for constructor arguments
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "address.h"
#include <array>
#include <cstdint>
#include <vector>

namespace deployer {

/**
 * @brief One 32-byte big-endian ABI word (uint256 / address / uintN slot)
 */
class Word256 {
public:
    static constexpr size_t SIZE = 32;
    using bytes_type = std::array<uint8_t, SIZE>;

    Word256() noexcept : bytes_{} {}
    explicit Word256(const bytes_type& bytes) noexcept : bytes_(bytes) {}

    static Word256 from_uint64(uint64_t value);

    /// Address left-padded to 32 bytes
    static Word256 from_address(const Address& address);

    const bytes_type& bytes() const { return bytes_; }

    bool operator==(const Word256& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Word256& other) const { return bytes_ != other.bytes_; }

private:
    bytes_type bytes_;
};

namespace abi {

/// Encode a tuple of static values (heads only, no dynamic tails)
std::vector<uint8_t> encode(const std::vector<Word256>& words);

} // namespace abi
} // namespace deployer

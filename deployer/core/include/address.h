/*
 * File:        address.h
 * Module:      deployer-core
 * Purpose:     20-byte contract address
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <fmt/format.h>

namespace deployer {

/**
 * @brief Address of a deployed contract
 *
 * Opaque 20-byte value. Text form is "0x" followed by 40 lowercase hex
 * digits.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;
    using bytes_type = std::array<uint8_t, SIZE>;

    // Default constructor creates the zero address
    Address() noexcept : bytes_{} {}

    explicit Address(const bytes_type& bytes) noexcept : bytes_(bytes) {}

    /**
     * @brief Parse address text
     *
     * Accepts an optional "0x"/"0X" prefix followed by exactly 40 hex digits
     * in either case.
     *
     * @throws AddressParseError if the text is not a valid address
     */
    static Address from_hex(const std::string& text);

    /// Lowercase, 0x-prefixed, 40 hex digits
    std::string to_hex() const;

    const bytes_type& bytes() const { return bytes_; }

    bool is_zero() const;

    bool operator==(const Address& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Address& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Address& other) const { return bytes_ < other.bytes_; }

private:
    bytes_type bytes_;
};

} // namespace deployer

// Hash function for Address to use in unordered_map/unordered_set
namespace std {
    template<>
    struct hash<deployer::Address> {
        size_t operator()(const deployer::Address& address) const noexcept {
            size_t h = 0;
            for (auto b : address.bytes()) {
                h = h * 131 + b;
            }
            return h;
        }
    };
}

// fmt formatter for Address
template <>
struct fmt::formatter<deployer::Address> : fmt::formatter<std::string> {
    auto format(const deployer::Address& address, format_context& ctx) const {
        return fmt::formatter<std::string>::format(address.to_hex(), ctx);
    }
};

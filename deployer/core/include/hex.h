/*
 * File:        hex.h
 * Module:      deployer-core
 * Purpose:     Hex encoding helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deployer {
namespace hex {

/// Value of a hex digit (either case), or -1
int digit_value(char c);

inline bool is_digit(char c) {
    return digit_value(c) >= 0;
}

/// Lowercase hex without prefix
std::string encode(const uint8_t* data, size_t size);

inline std::string encode(const std::vector<uint8_t>& bytes) {
    return encode(bytes.data(), bytes.size());
}

/// Remove a leading "0x" / "0X" if present
std::string strip_prefix(const std::string& text);

/**
 * @brief Decode bare hex text
 *
 * A 0x prefix is not accepted; callers strip it with strip_prefix first.
 *
 * @return Bytes, or std::nullopt on odd length or non-hex characters
 */
std::optional<std::vector<uint8_t>> decode(const std::string& digits);

} // namespace hex
} // namespace deployer

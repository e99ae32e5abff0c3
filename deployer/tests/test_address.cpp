/*
 * File:        test_address.cpp
 * Module:      deployer-tests
 * Purpose:     Address, ContractId and ABI word test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "abi.h"
#include "address.h"
#include "contract_id.h"
#include "errors.h"
#include "hex.h"
#include <cassert>
#include <iostream>
#include <unordered_set>

using namespace deployer;

static bool parse_fails(const std::string& text) {
    try {
        Address::from_hex(text);
    } catch (const AddressParseError&) {
        return true;
    }
    return false;
}

void test_address_round_trip() {
    auto address = Address::from_hex("0x5FbDB2315678afecb367f032d93F642f64180aa3");
    assert(address.to_hex() == "0x5fbdb2315678afecb367f032d93f642f64180aa3");
    assert(address.bytes()[0] == 0x5f);
    assert(address.bytes()[19] == 0xa3);
    assert(!address.is_zero());

    // Prefix is optional
    assert(Address::from_hex("5fbdb2315678afecb367f032d93f642f64180aa3") == address);
    assert(Address::from_hex("0X5FBDB2315678AFECB367F032D93F642F64180AA3") == address);

    std::cout << "test_address_round_trip: PASSED\n";
}

void test_address_zero_default() {
    Address zero;
    assert(zero.is_zero());
    assert(zero.to_hex() == "0x0000000000000000000000000000000000000000");
    assert(zero.to_hex().size() == 42);

    std::cout << "test_address_zero_default: PASSED\n";
}

void test_address_rejects_malformed() {
    assert(parse_fails(""));
    assert(parse_fails("0x"));
    assert(parse_fails("0x1234"));
    assert(parse_fails("0x5fbdb2315678afecb367f032d93f642f64180aa3ff"));
    assert(parse_fails("0x5fbdb2315678afecb367f032d93f642f64180ag3"));
    assert(parse_fails(" 0x5fbdb2315678afecb367f032d93f642f64180aa3"));

    // A doubled prefix leaves 40 characters but only 38 digits
    assert(parse_fails("0x0x00112233445566778899aabbccddeeff001122"));
    assert(parse_fails("0X0X00112233445566778899aabbccddeeff001122"));
    assert(parse_fails("0x0X00112233445566778899aabbccddeeff001122"));

    // AddressParseError is a configuration error
    bool caught = false;
    try {
        Address::from_hex("nope");
    } catch (const ConfigError& e) {
        caught = true;
        assert(std::string(e.what()).find("nope") != std::string::npos);
    }
    assert(caught);

    std::cout << "test_address_rejects_malformed: PASSED\n";
}

void test_hex_decode_bare_digits() {
    assert(hex::decode("00ff10") == std::vector<uint8_t>({0x00, 0xff, 0x10}));
    assert(hex::decode("") == std::vector<uint8_t>());
    assert(!hex::decode("0x00"));
    assert(!hex::decode("abc"));
    assert(hex::strip_prefix("0x0x00") == "0x00");

    std::cout << "test_hex_decode_bare_digits: PASSED\n";
}

void test_address_ordering_and_hash() {
    auto a = Address::from_hex("0x00000000000000000000000000000000000000aa");
    auto b = Address::from_hex("0x00000000000000000000000000000000000000bb");
    assert(a < b);
    assert(a != b);

    std::unordered_set<Address> set{a, b, a};
    assert(set.size() == 2);

    assert(fmt::format("{}", a) == "0x00000000000000000000000000000000000000aa");

    std::cout << "test_address_ordering_and_hash: PASSED\n";
}

void test_contract_id_names() {
    assert(std::string(contract_id_name(ContractId::PlonkVerifier)) == "ESPRESSO_SEQUENCER_PLONK_VERIFIER_ADDRESS");
    assert(std::string(contract_id_name(ContractId::StateUpdateVK)) ==
           "ESPRESSO_SEQUENCER_LIGHT_CLIENT_STATE_UPDATE_VK_ADDRESS");
    assert(std::string(contract_id_name(ContractId::LightClientProxy)) ==
           "ESPRESSO_SEQUENCER_LIGHT_CLIENT_PROXY_ADDRESS");
    assert(fmt::format("{}", ContractId::HotShot) == "ESPRESSO_SEQUENCER_HOTSHOT_ADDRESS");
    assert(to_string(ContractId::LightClient) == "ESPRESSO_SEQUENCER_LIGHT_CLIENT_ADDRESS");

    assert(all_contract_ids().size() == 5);

    std::cout << "test_contract_id_names: PASSED\n";
}

void test_contract_id_from_string() {
    for (auto id : all_contract_ids()) {
        assert(contract_id_from_string(contract_id_name(id)) == id);
        assert(contract_id_from_string(contract_id_option_key(id)) == id);
    }
    assert(contract_id_from_string("light-client-state-update-vk") == ContractId::StateUpdateVK);
    assert(!contract_id_from_string("LightClient").has_value());
    assert(!contract_id_from_string("").has_value());

    std::cout << "test_contract_id_from_string: PASSED\n";
}

void test_word256_encoding() {
    auto word = Word256::from_uint64(0x0102030405060708ULL);
    for (size_t i = 0; i < 24; ++i) {
        assert(word.bytes()[i] == 0);
    }
    assert(word.bytes()[24] == 0x01);
    assert(word.bytes()[31] == 0x08);

    auto address = Address::from_hex("0xffffffffffffffffffffffffffffffffffffffff");
    auto padded = Word256::from_address(address);
    for (size_t i = 0; i < 12; ++i) {
        assert(padded.bytes()[i] == 0);
    }
    for (size_t i = 12; i < 32; ++i) {
        assert(padded.bytes()[i] == 0xff);
    }

    auto encoded = abi::encode({Word256::from_uint64(1), Word256::from_uint64(2)});
    assert(encoded.size() == 64);
    assert(encoded[31] == 1);
    assert(encoded[63] == 2);

    std::cout << "test_word256_encoding: PASSED\n";
}

int main() {
    std::cout << "Running Address tests...\n";

    test_address_round_trip();
    test_address_zero_default();
    test_address_rejects_malformed();
    test_hex_decode_bare_digits();
    test_address_ordering_and_hash();
    test_contract_id_names();
    test_contract_id_from_string();
    test_word256_encoding();

    std::cout << "All Address tests passed!\n";
    return 0;
}

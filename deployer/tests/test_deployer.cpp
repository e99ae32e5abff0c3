/*
 * File:        test_deployer.cpp
 * Module:      deployer-tests
 * Purpose:     Memoized deployment orchestration test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "deployer.h"
#include "errors.h"
#include "logging.h"
#include "simulated_backend.h"
#include <cassert>
#include <iostream>

using namespace deployer;

namespace {

PreparedDeployment make_tx(const std::string& name, uint8_t marker) {
    PreparedDeployment tx;
    tx.contract_name = name;
    tx.code = {0x60, 0x80, 0x60, 0x40, marker};
    return tx;
}

} // anonymous namespace

void test_deploy_tx_records_address() {
    AddressCache cache;
    SimulatedBackend backend;
    Deployer deployer(cache, backend);

    Address expected = backend.next_address();
    Address address = deployer.deploy_tx(ContractId::HotShot, make_tx("HotShot", 1));

    assert(address == expected);
    assert(cache.lookup(ContractId::HotShot) == address);
    assert(backend.creation_count() == 1);
    assert(backend.creations()[0].code == make_tx("HotShot", 1).code);
    assert(backend.creations()[0].constructor_args.empty());

    std::cout << "test_deploy_tx_records_address: PASSED\n";
}

void test_cached_identifier_is_not_deployed() {
    Address predeployed = Address::from_hex("0x00000000000000000000000000000000000000aa");
    AddressCache cache;
    cache.record(ContractId::PlonkVerifier, predeployed);

    SimulatedBackend backend;
    Deployer deployer(cache, backend);

    // deploy_tx broadcasts nothing
    assert(deployer.deploy_tx(ContractId::PlonkVerifier, make_tx("PlonkVerifier", 1)) == predeployed);
    assert(backend.attempt_count() == 0);

    // deploy_fn never invokes the procedure
    int invocations = 0;
    Address address = deployer.deploy_fn(ContractId::PlonkVerifier, [&](Deployer&) {
        ++invocations;
        return Address();
    });
    assert(address == predeployed);
    assert(invocations == 0);
    assert(cache.size() == 1);

    std::cout << "test_cached_identifier_is_not_deployed: PASSED\n";
}

void test_repeat_deployment_is_memoized() {
    AddressCache cache;
    SimulatedBackend backend;
    Deployer deployer(cache, backend);

    int invocations = 0;
    auto procedure = [&](Deployer& d) {
        ++invocations;
        return d.broadcast(make_tx("HotShot", 7));
    };

    Address first = deployer.deploy_fn(ContractId::HotShot, procedure);
    Address second = deployer.deploy_fn(ContractId::HotShot, procedure);

    assert(first == second);
    assert(invocations == 1);
    assert(backend.creation_count() == 1);

    std::cout << "test_repeat_deployment_is_memoized: PASSED\n";
}

void test_dependencies_recorded_before_dependent() {
    AddressCache cache;
    SimulatedBackend backend;
    Deployer deployer(cache, backend);

    Address library;
    Address result = deployer.deploy_fn(ContractId::LightClient, [&](Deployer& d) {
        library = d.deploy_tx(ContractId::PlonkVerifier, make_tx("PlonkVerifier", 1));

        // The dependency is visible to the rest of the procedure
        assert(d.cache().lookup(ContractId::PlonkVerifier) == library);
        assert(!d.cache().contains(ContractId::LightClient));

        return d.broadcast(make_tx("LightClient", 2));
    });

    assert(cache.size() == 2);
    assert(cache.lookup(ContractId::PlonkVerifier) == library);
    assert(cache.lookup(ContractId::LightClient) == result);
    assert(library != result);
    assert(backend.creations()[0].address == library);
    assert(backend.creations()[1].address == result);

    std::cout << "test_dependencies_recorded_before_dependent: PASSED\n";
}

void test_backend_failure_names_contract() {
    AddressCache cache;
    SimulatedBackend backend;
    backend.fail_creation(0);
    Deployer deployer(cache, backend);

    bool caught = false;
    try {
        deployer.deploy_tx(ContractId::HotShot, make_tx("HotShot", 1));
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.contract() == ContractId::HotShot);
        assert(e.cause() == ErrorCause::BACKEND);
        assert(std::string(e.what()).find("ESPRESSO_SEQUENCER_HOTSHOT_ADDRESS") != std::string::npos);
    }
    assert(caught);
    assert(cache.empty());

    // A later attempt is not affected by the earlier failure
    Address address = deployer.deploy_tx(ContractId::HotShot, make_tx("HotShot", 1));
    assert(cache.lookup(ContractId::HotShot) == address);
    assert(backend.attempt_count() == 2);

    std::cout << "test_backend_failure_names_contract: PASSED\n";
}

void test_failure_keeps_completed_dependencies() {
    AddressCache cache;
    SimulatedBackend backend;
    backend.fail_creation(1);
    Deployer deployer(cache, backend);

    bool caught = false;
    try {
        deployer.deploy_fn(ContractId::LightClient, [](Deployer& d) {
            d.deploy_tx(ContractId::PlonkVerifier, make_tx("PlonkVerifier", 1));
            return d.broadcast(make_tx("LightClient", 2));
        });
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.contract() == ContractId::LightClient);
        assert(e.cause() == ErrorCause::BACKEND);
    }
    assert(caught);
    assert(cache.contains(ContractId::PlonkVerifier));
    assert(!cache.contains(ContractId::LightClient));

    std::cout << "test_failure_keeps_completed_dependencies: PASSED\n";
}

void test_nested_failure_keeps_its_name() {
    AddressCache cache;
    SimulatedBackend backend;
    backend.fail_creation(0);
    Deployer deployer(cache, backend);

    bool reached = false;
    bool caught = false;
    try {
        deployer.deploy_fn(ContractId::LightClient, [&](Deployer& d) {
            d.deploy_tx(ContractId::StateUpdateVK, make_tx("LightClientStateUpdateVK", 1));
            reached = true;
            return d.broadcast(make_tx("LightClient", 2));
        });
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.contract() == ContractId::StateUpdateVK);
        assert(e.cause() == ErrorCause::BACKEND);
    }
    assert(caught);
    assert(!reached);
    assert(cache.empty());

    std::cout << "test_nested_failure_keeps_its_name: PASSED\n";
}

void test_procedure_error_causes() {
    AddressCache cache;
    SimulatedBackend backend;
    Deployer deployer(cache, backend);

    bool caught = false;
    try {
        deployer.deploy_fn(ContractId::LightClient, [](Deployer&) -> Address {
            throw LinkingError("LightClient", "contracts/src/A.sol:A", "unresolved library reference");
        });
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.contract() == ContractId::LightClient);
        assert(e.cause() == ErrorCause::LINKING);
        assert(e.detail() == "unresolved library reference");
    }
    assert(caught);

    caught = false;
    try {
        deployer.deploy_fn(ContractId::HotShot, [](Deployer&) -> Address {
            throw ArtifactLoadError("HotShot", "odd length");
        });
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.cause() == ErrorCause::ARTIFACT_LOAD);
    }
    assert(caught);

    caught = false;
    try {
        deployer.deploy_fn(ContractId::HotShot, [](Deployer&) -> Address {
            throw std::runtime_error("unexpected");
        });
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.contract() == ContractId::HotShot);
        assert(e.cause() == ErrorCause::OTHER);
        assert(e.detail() == "unexpected");
    }
    assert(caught);

    assert(cache.empty());
    assert(backend.attempt_count() == 0);

    std::cout << "test_procedure_error_causes: PASSED\n";
}

void test_empty_code_is_rejected() {
    AddressCache cache;
    SimulatedBackend backend;
    Deployer deployer(cache, backend);

    bool caught = false;
    try {
        deployer.deploy_tx(ContractId::HotShot, PreparedDeployment{"HotShot", {}, {}});
    } catch (const DeploymentError& e) {
        caught = true;
        assert(e.cause() == ErrorCause::BACKEND);
    }
    assert(caught);
    assert(backend.creation_count() == 0);

    std::cout << "test_empty_code_is_rejected: PASSED\n";
}

void test_simulated_addresses() {
    SimulatedBackend backend(Address::from_hex("0x00000000000000000000000000000000000000ff"));
    assert(backend.next_address().to_hex() == "0x0000000000000000000000000000000000000100");

    Address first = backend.create_contract({0x00}, {});
    assert(first.to_hex() == "0x0000000000000000000000000000000000000100");
    assert(backend.next_address().to_hex() == "0x0000000000000000000000000000000000000101");

    Receipt receipt = backend.send_transaction(first, {0x01, 0x02});
    assert(receipt.success);
    assert(receipt.transaction_hash.size() == 66);
    assert(backend.calls().size() == 1);
    assert(backend.calls()[0].to == first);

    std::cout << "test_simulated_addresses: PASSED\n";
}

int main() {
    std::cout << "Running Deployer tests...\n";
    set_log_level("warn");

    test_deploy_tx_records_address();
    test_cached_identifier_is_not_deployed();
    test_repeat_deployment_is_memoized();
    test_dependencies_recorded_before_dependent();
    test_backend_failure_names_contract();
    test_failure_keeps_completed_dependencies();
    test_nested_failure_keeps_its_name();
    test_procedure_error_causes();
    test_empty_code_is_rejected();
    test_simulated_addresses();

    std::cout << "All Deployer tests passed!\n";
    return 0;
}

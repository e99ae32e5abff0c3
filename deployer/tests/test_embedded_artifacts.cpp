/*
 * File:        test_embedded_artifacts.cpp
 * Module:      deployer-tests
 * Purpose:     Embedded bytecode template test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "embedded_artifacts.h"
#include "errors.h"
#include "light_client.h"
#include "logging.h"
#include <cassert>
#include <iostream>

using namespace deployer;

void test_all_templates_present() {
    auto& artifacts = EmbeddedArtifacts::instance();
    auto names = artifacts.get_artifact_names();
    assert(names.size() == 6);

    for (const char* name : {artifact_names::HOTSHOT, artifact_names::PLONK_VERIFIER,
                             artifact_names::STATE_UPDATE_VK, artifact_names::STATE_UPDATE_VK_MOCK,
                             artifact_names::LIGHT_CLIENT, artifact_names::LIGHT_CLIENT_MOCK}) {
        assert(artifacts.has_artifact(name));
        const auto& artifact = artifacts.load(name);
        assert(artifact.name() == name);
        assert(artifact.size_bytes() > 0);
    }

    assert(!artifacts.has_artifact("LightClientProxy"));

    std::cout << "test_all_templates_present: PASSED\n";
}

void test_library_templates_are_linked() {
    auto& artifacts = EmbeddedArtifacts::instance();
    for (const char* name : {artifact_names::HOTSHOT, artifact_names::PLONK_VERIFIER,
                             artifact_names::STATE_UPDATE_VK, artifact_names::STATE_UPDATE_VK_MOCK}) {
        assert(!artifacts.load(name).is_unlinked());
    }

    // Production and mock key libraries are different contracts
    assert(artifacts.load(artifact_names::STATE_UPDATE_VK).object() !=
           artifacts.load(artifact_names::STATE_UPDATE_VK_MOCK).object());

    std::cout << "test_library_templates_are_linked: PASSED\n";
}

void test_light_client_references() {
    auto& artifacts = EmbeddedArtifacts::instance();

    const auto& production = artifacts.load(artifact_names::LIGHT_CLIENT);
    assert(production.unresolved_references().size() == 2);
    const LinkReference* pv = production.find_reference(library_names::PLONK_VERIFIER);
    const LinkReference* vk = production.find_reference(library_names::STATE_UPDATE_VK);
    assert(pv && vk);
    assert(pv->offsets == std::vector<size_t>({93, 176}));
    assert(vk->offsets == std::vector<size_t>({150}));
    assert(production.find_reference(library_names::STATE_UPDATE_VK_MOCK) == nullptr);

    const auto& mock = artifacts.load(artifact_names::LIGHT_CLIENT_MOCK);
    assert(mock.unresolved_references().size() == 2);
    pv = mock.find_reference(library_names::PLONK_VERIFIER);
    vk = mock.find_reference(library_names::STATE_UPDATE_VK_MOCK);
    assert(pv && vk);
    assert(pv->offsets == std::vector<size_t>({93}));
    assert(vk->offsets == std::vector<size_t>({150}));
    assert(mock.find_reference(library_names::STATE_UPDATE_VK) == nullptr);

    std::cout << "test_light_client_references: PASSED\n";
}

void test_load_is_cached() {
    auto& artifacts = EmbeddedArtifacts::instance();
    const BytecodeArtifact* first = &artifacts.load(artifact_names::LIGHT_CLIENT);
    const BytecodeArtifact* second = &artifacts.load(artifact_names::LIGHT_CLIENT);
    assert(first == second);

    std::cout << "test_load_is_cached: PASSED\n";
}

void test_unknown_template() {
    bool caught = false;
    try {
        EmbeddedArtifacts::instance().load("NoSuchContract");
    } catch (const ArtifactLoadError& e) {
        caught = true;
        assert(e.resource() == "NoSuchContract");
    }
    assert(caught);

    caught = false;
    try {
        EmbeddedArtifacts::instance().raw_json("NoSuchContract");
    } catch (const ArtifactLoadError&) {
        caught = true;
    }
    assert(caught);

    std::cout << "test_unknown_template: PASSED\n";
}

int main() {
    std::cout << "Running EmbeddedArtifacts tests...\n";
    set_log_level("warn");

    test_all_templates_present();
    test_library_templates_are_linked();
    test_light_client_references();
    test_load_is_cached();
    test_unknown_template();

    std::cout << "All EmbeddedArtifacts tests passed!\n";
    return 0;
}

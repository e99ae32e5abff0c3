/*
 * File:        embedded_artifacts.h
 * Module:      deployer-core
 * Purpose:     Contract bytecode templates compiled into the binary
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "bytecode.h"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace deployer {

/**
 * @brief Raw resource produced at build time by cmake/embed_artifacts.cmake
 */
struct EmbeddedResource {
    const char* name;
    const unsigned char* data;
    size_t size;
};

// Defined in the generated embedded_artifact_data.cpp
const EmbeddedResource* embedded_resource_table();
size_t embedded_resource_count();

/// Names of the embedded templates
namespace artifact_names {
    constexpr const char* HOTSHOT = "HotShot";
    constexpr const char* PLONK_VERIFIER = "PlonkVerifier";
    constexpr const char* STATE_UPDATE_VK = "LightClientStateUpdateVK";
    constexpr const char* STATE_UPDATE_VK_MOCK = "LightClientStateUpdateVKMock";
    constexpr const char* LIGHT_CLIENT = "LightClient";
    constexpr const char* LIGHT_CLIENT_MOCK = "LightClientMock";
}

/**
 * @brief Access to the compiled-in bytecode templates
 *
 * The deployer ships its creation images inside the executable, so no
 * contract artifacts have to be distributed with it. Templates are parsed
 * on first use and kept for the life of the process.
 *
 * Usage:
 * ```cpp
 * const auto& template_code = EmbeddedArtifacts::instance().load("LightClient");
 * ```
 *
 * Thread safety: Not thread-safe.
 */
class EmbeddedArtifacts {
public:
    /**
     * @brief Get singleton instance
     */
    static EmbeddedArtifacts& instance();

    bool has_artifact(const std::string& name) const;

    /// Names of all embedded templates, sorted
    std::vector<std::string> get_artifact_names() const;

    /**
     * @brief JSON text of a template
     * @throws ArtifactLoadError if no template has this name
     */
    std::string raw_json(const std::string& name) const;

    /**
     * @brief Parsed template
     * @throws ArtifactLoadError if no template has this name or it is malformed
     */
    const BytecodeArtifact& load(const std::string& name);

private:
    EmbeddedArtifacts() = default;
    EmbeddedArtifacts(const EmbeddedArtifacts&) = delete;
    EmbeddedArtifacts& operator=(const EmbeddedArtifacts&) = delete;

    const EmbeddedResource* find_resource(const std::string& name) const;

    std::map<std::string, BytecodeArtifact> parsed_;
};

} // namespace deployer

/*
 * File:        embedded_artifacts.cpp
 * Module:      deployer-core
 * Purpose:     Contract bytecode templates compiled into the binary
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "embedded_artifacts.h"
#include "errors.h"
#include "logging.h"
#include <algorithm>

namespace deployer {

EmbeddedArtifacts& EmbeddedArtifacts::instance() {
    static EmbeddedArtifacts artifacts;
    return artifacts;
}

const EmbeddedResource* EmbeddedArtifacts::find_resource(const std::string& name) const {
    const EmbeddedResource* table = embedded_resource_table();
    for (size_t i = 0; i < embedded_resource_count(); ++i) {
        if (name == table[i].name) {
            return &table[i];
        }
    }
    return nullptr;
}

bool EmbeddedArtifacts::has_artifact(const std::string& name) const {
    return find_resource(name) != nullptr;
}

std::vector<std::string> EmbeddedArtifacts::get_artifact_names() const {
    std::vector<std::string> names;
    const EmbeddedResource* table = embedded_resource_table();
    for (size_t i = 0; i < embedded_resource_count(); ++i) {
        names.emplace_back(table[i].name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string EmbeddedArtifacts::raw_json(const std::string& name) const {
    const EmbeddedResource* resource = find_resource(name);
    if (!resource) {
        throw ArtifactLoadError(name, "no such embedded artifact");
    }
    return std::string(reinterpret_cast<const char*>(resource->data), resource->size);
}

const BytecodeArtifact& EmbeddedArtifacts::load(const std::string& name) {
    auto it = parsed_.find(name);
    if (it != parsed_.end()) {
        return it->second;
    }

    auto artifact = BytecodeArtifact::parse_json(name, raw_json(name));
    DEPLOYER_LOG_DEBUG("Loaded embedded artifact {}: {} bytes, {} unresolved reference(s)",
                       name, artifact.size_bytes(), artifact.unresolved_references().size());

    return parsed_.emplace(name, std::move(artifact)).first->second;
}

} // namespace deployer

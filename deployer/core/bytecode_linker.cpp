/*
 * File:        bytecode_linker.cpp
 * Module:      deployer-core
 * Purpose:     Library linking of contract creation images
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "bytecode_linker.h"
#include "errors.h"
#include "hex.h"
#include "logging.h"

namespace deployer {
namespace bytecode_linker {

BytecodeArtifact apply_link(const BytecodeArtifact& artifact,
                            const std::string& qualified_name,
                            const Address& address) {
    const LinkReference* ref = artifact.find_reference(qualified_name);
    if (ref == nullptr) {
        return artifact;
    }

    std::string object = artifact.object();
    const std::string address_hex = hex::encode(address.bytes().data(), address.bytes().size());
    for (size_t offset : ref->offsets) {
        object.replace(offset * 2, address_hex.size(), address_hex);
    }

    std::vector<LinkReference> remaining;
    for (const auto& other : artifact.unresolved_references()) {
        if (other.qualified_name != qualified_name) {
            remaining.push_back(other);
        }
    }

    DEPLOYER_LOG_DEBUG("Linked {} into {} at {} location(s)", qualified_name, artifact.name(), ref->offsets.size());
    return BytecodeArtifact(artifact.name(), std::move(object), std::move(remaining));
}

BytecodeArtifact link_library(const BytecodeArtifact& artifact,
                              const std::string& qualified_name,
                              const Address& address) {
    if (artifact.find_reference(qualified_name) == nullptr) {
        throw LinkingError(artifact.name(), qualified_name,
                           fmt::format("error linking {} lib: {} has no unresolved reference to it",
                                       qualified_name, artifact.name()));
    }
    return apply_link(artifact, qualified_name, address);
}

BytecodeArtifact link_all(const BytecodeArtifact& artifact,
                          const std::map<std::string, Address>& resolutions) {
    BytecodeArtifact linked = artifact;
    for (const auto& [qualified_name, address] : resolutions) {
        linked = apply_link(linked, qualified_name, address);
    }
    return linked;
}

ResolvedArtifact assert_fully_linked(const BytecodeArtifact& artifact) {
    const auto& remaining = artifact.unresolved_references();
    if (!remaining.empty()) {
        const auto& first = remaining.front();
        throw LinkingError(artifact.name(), first.qualified_name,
                           fmt::format("failed to link {}: unresolved library reference {} ({} unresolved in total)",
                                       artifact.name(), first.qualified_name, remaining.size()));
    }

    auto bytes = hex::decode(artifact.object());
    if (!bytes) {
        throw ArtifactLoadError(artifact.name(), "error parsing bytecode for linked contract");
    }

    return ResolvedArtifact(artifact.name(), std::move(*bytes));
}

} // namespace bytecode_linker
} // namespace deployer

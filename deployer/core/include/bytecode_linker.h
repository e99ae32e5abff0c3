/*
 * File:        bytecode_linker.h
 * Module:      deployer-core
 * Purpose:     Library linking of contract creation images
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include "address.h"
#include "bytecode.h"
#include <map>
#include <string>

namespace deployer {

/// Library linking functions
namespace bytecode_linker {

    /**
     * @brief Substitute a library address at every placeholder of a reference
     *
     * References with other names are left untouched. If the artifact has no
     * reference with this name the result equals the input, so applying the
     * same link twice is harmless.
     */
    BytecodeArtifact apply_link(const BytecodeArtifact& artifact,
                                const std::string& qualified_name,
                                const Address& address);

    /**
     * @brief Like apply_link, but the reference must exist
     * @throws LinkingError if the artifact has no unresolved reference of that name
     */
    BytecodeArtifact link_library(const BytecodeArtifact& artifact,
                                  const std::string& qualified_name,
                                  const Address& address);

    /// Apply a whole resolution set (qualified name -> address)
    BytecodeArtifact link_all(const BytecodeArtifact& artifact,
                              const std::map<std::string, Address>& resolutions);

    /**
     * @brief Prove that no reference remains and decode the image
     * @throws LinkingError naming the first remaining reference
     * @throws ArtifactLoadError if the image is not valid hex
     */
    ResolvedArtifact assert_fully_linked(const BytecodeArtifact& artifact);

} // namespace bytecode_linker
} // namespace deployer

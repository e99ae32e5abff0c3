/*
 * File:        bytecode.h
 * Module:      deployer-core
 * Purpose:     Unlinked and resolved contract creation images
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace deployer {

/**
 * @brief A library reference left unresolved by the compiler
 *
 * The qualified name is "<source file>:<library>". Each offset is the byte
 * position of a 20-byte placeholder in the creation image.
 */
struct LinkReference {
    std::string qualified_name;
    std::vector<size_t> offsets;
};

/**
 * @brief Creation image that may still contain library placeholders
 *
 * Stored as hex text (without 0x) because placeholders such as
 * "__$c1a2...$__" are not hex. Immutable; linking produces a new artifact.
 */
class BytecodeArtifact {
public:
    static constexpr size_t PLACEHOLDER_BYTES = 20;

    BytecodeArtifact() = default;

    /**
     * @throws ArtifactLoadError if the object text or references are malformed
     */
    BytecodeArtifact(std::string name, std::string object, std::vector<LinkReference> references);

    /**
     * @brief Parse a solc "bytecode" JSON object
     *
     * Shape: { "object": "0x...", "linkReferences": { "<file>": { "<lib>":
     * [ { "start": N, "length": 20 } ] } } }
     *
     * @throws ArtifactLoadError if the JSON or its contents are malformed
     */
    static BytecodeArtifact parse_json(const std::string& name, const std::string& json);

    const std::string& name() const { return name_; }

    /// Hex text of the creation image, placeholders included
    const std::string& object() const { return object_; }

    /// References still to be linked, in artifact order
    const std::vector<LinkReference>& unresolved_references() const { return references_; }

    size_t size_bytes() const { return object_.size() / 2; }

    bool is_unlinked() const { return !references_.empty(); }

    /// Reference with the given qualified name, or nullptr
    const LinkReference* find_reference(const std::string& qualified_name) const;

private:
    std::string name_;
    std::string object_;
    std::vector<LinkReference> references_;

    void validate() const;
};

class ResolvedArtifact;

namespace bytecode_linker {
ResolvedArtifact assert_fully_linked(const BytecodeArtifact& artifact);
}

/**
 * @brief Creation image with every library reference substituted
 *
 * Only the linker creates these, after proving that no reference remains.
 */
class ResolvedArtifact {
public:
    const std::string& name() const { return name_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    friend ResolvedArtifact bytecode_linker::assert_fully_linked(const BytecodeArtifact& artifact);

    ResolvedArtifact(std::string name, std::vector<uint8_t> bytes)
        : name_(std::move(name)), bytes_(std::move(bytes)) {}

    std::string name_;
    std::vector<uint8_t> bytes_;
};

} // namespace deployer

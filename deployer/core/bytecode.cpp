/*
 * File:        bytecode.cpp
 * Module:      deployer-core
 * Purpose:     Bytecode artifact parsing and validation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "bytecode.h"
#include "errors.h"
#include "hex.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>

namespace deployer {

BytecodeArtifact::BytecodeArtifact(std::string name, std::string object, std::vector<LinkReference> references)
    : name_(std::move(name))
    , object_(hex::strip_prefix(object))
{
    // One entry per library: repeated names (e.g. duplicate JSON keys) are merged
    for (auto& ref : references) {
        auto existing = std::find_if(references_.begin(), references_.end(),
            [&ref](const LinkReference& r) { return r.qualified_name == ref.qualified_name; });
        if (existing == references_.end()) {
            references_.push_back(std::move(ref));
        } else {
            existing->offsets.insert(existing->offsets.end(), ref.offsets.begin(), ref.offsets.end());
        }
    }

    for (auto& ref : references_) {
        std::sort(ref.offsets.begin(), ref.offsets.end());
        ref.offsets.erase(std::unique(ref.offsets.begin(), ref.offsets.end()), ref.offsets.end());
    }

    // Order references by their first placeholder in the image
    std::stable_sort(references_.begin(), references_.end(),
        [](const LinkReference& a, const LinkReference& b) {
            size_t first_a = a.offsets.empty() ? SIZE_MAX : a.offsets.front();
            size_t first_b = b.offsets.empty() ? SIZE_MAX : b.offsets.front();
            return first_a < first_b;
        });

    validate();
}

void BytecodeArtifact::validate() const {
    if (object_.size() % 2 != 0) {
        throw ArtifactLoadError(name_, "creation image has an odd number of hex digits");
    }

    const size_t image_bytes = size_bytes();
    std::vector<bool> placeholder(image_bytes, false);

    for (const auto& ref : references_) {
        if (ref.qualified_name.empty()) {
            throw ArtifactLoadError(name_, "link reference without a name");
        }
        for (size_t offset : ref.offsets) {
            if (offset > image_bytes || image_bytes - offset < PLACEHOLDER_BYTES) {
                throw ArtifactLoadError(name_, "reference '" + ref.qualified_name + "' at byte " +
                                        std::to_string(offset) + " is outside the " +
                                        std::to_string(image_bytes) + "-byte image");
            }
            for (size_t i = offset; i < offset + PLACEHOLDER_BYTES; ++i) {
                if (placeholder[i]) {
                    throw ArtifactLoadError(name_, "reference '" + ref.qualified_name + "' at byte " +
                                            std::to_string(offset) + " overlaps another reference");
                }
                placeholder[i] = true;
            }
        }
    }

    // Everything that is not a placeholder must already be code
    for (size_t i = 0; i < image_bytes; ++i) {
        if (placeholder[i]) continue;
        if (!hex::is_digit(object_[2 * i]) || !hex::is_digit(object_[2 * i + 1])) {
            throw ArtifactLoadError(name_, "non-hex character at byte " + std::to_string(i));
        }
    }
}

const LinkReference* BytecodeArtifact::find_reference(const std::string& qualified_name) const {
    for (const auto& ref : references_) {
        if (ref.qualified_name == qualified_name) {
            return &ref;
        }
    }
    return nullptr;
}

BytecodeArtifact BytecodeArtifact::parse_json(const std::string& name, const std::string& json) {
    YAML::Node root;

    // yaml-cpp reads JSON documents as YAML flow collections
    try {
        root = YAML::Load(json);
    } catch (const YAML::Exception& e) {
        throw ArtifactLoadError(name, std::string("invalid JSON: ") + e.what());
    }

    std::string object;
    std::vector<LinkReference> references;

    try {
        if (!root.IsMap() || !root["object"]) {
            throw ArtifactLoadError(name, "missing 'object' field");
        }
        object = root["object"].as<std::string>();

        if (root["linkReferences"]) {
            const YAML::Node files = root["linkReferences"];
            if (!files.IsMap()) {
                throw ArtifactLoadError(name, "'linkReferences' must be an object");
            }

            for (const auto& file : files) {
                std::string file_name = file.first.as<std::string>();
                for (const auto& library : file.second) {
                    LinkReference ref;
                    ref.qualified_name = file_name + ":" + library.first.as<std::string>();

                    for (const auto& location : library.second) {
                        size_t length = location["length"].as<size_t>(PLACEHOLDER_BYTES);
                        if (length != PLACEHOLDER_BYTES) {
                            throw ArtifactLoadError(name, "reference '" + ref.qualified_name +
                                                    "' has length " + std::to_string(length) +
                                                    ", expected 20");
                        }
                        ref.offsets.push_back(location["start"].as<size_t>());
                    }

                    references.push_back(std::move(ref));
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw ArtifactLoadError(name, std::string("malformed bytecode object: ") + e.what());
    }

    return BytecodeArtifact(name, object, std::move(references));
}

} // namespace deployer

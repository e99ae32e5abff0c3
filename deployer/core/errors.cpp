/*
 * File:        errors.cpp
 * Module:      deployer-core
 * Purpose:     Error category names
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#include "errors.h"

namespace deployer {

const char* error_cause_to_string(ErrorCause cause) {
    switch (cause) {
        case ErrorCause::BACKEND:       return "backend";
        case ErrorCause::LINKING:       return "linking";
        case ErrorCause::ARTIFACT_LOAD: return "artifact load";
        case ErrorCause::OTHER:         return "other";
    }
    return "unknown";
}

} // namespace deployer

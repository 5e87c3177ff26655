/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

#include <string>

#include "ConflictDecision.h"
#include "FileOpError.h"
#include "OperationItem.h"

namespace TwinPane::Core::IO {

/**
 * @brief Display strings for engine enums
 *
 * Implemented by the localization layer. The engine never consults labels for
 * control flow.
 */
class ILabelLookup {
public:
    virtual ~ILabelLookup() = default;

    virtual std::string label(OperationState state) const = 0;
    virtual std::string label(OperationKind kind) const = 0;
    virtual std::string label(FileOpError error) const = 0;
    virtual std::string label(ConflictAction action) const = 0;

    // "Copy: Failed (Permission denied)"
    std::string describe(const OperationItem& item) const;
};

// English labels
class DefaultLabelLookup : public ILabelLookup {
public:
    std::string label(OperationState state) const override;
    std::string label(OperationKind kind) const override;
    std::string label(FileOpError error) const override;
    std::string label(ConflictAction action) const override;
};

} // namespace TwinPane::Core::IO

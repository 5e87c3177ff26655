/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

/**
 * @file TwinPaneCore.h
 * @brief Single header that includes all TwinPane Core components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/CancellationToken.h"
#include "Concurrency/IConcurrencyProvider.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkContractHandle.h"
#include "Concurrency/WorkService.h"

// File operations
#include "FileOperations/ConflictDecision.h"
#include "FileOperations/ConflictResolver.h"
#include "FileOperations/FileItem.h"
#include "FileOperations/FileOpError.h"
#include "FileOperations/FileOperationsManager.h"
#include "FileOperations/FileTransfer.h"
#include "FileOperations/LabelLookup.h"
#include "FileOperations/OperationItem.h"
#include "FileOperations/OperationPlanner.h"
#include "FileOperations/PathUtils.h"
#include "FileOperations/ProgressSink.h"

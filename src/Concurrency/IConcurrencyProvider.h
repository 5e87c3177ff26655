/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

namespace TwinPane {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    /**
     * @brief Executor interface a WorkContractGroup reports to
     *
     * A group holding a provider calls notifyWorkAvailable() every time a contract is
     * scheduled and notifyGroupDestroyed() from its destructor. Groups without a
     * provider, or whose provider is not accepting work, are drained by their owner
     * through executeAllBackgroundWork().
     */
    class IConcurrencyProvider {
    public:
        virtual ~IConcurrencyProvider() = default;

        virtual void notifyWorkAvailable(WorkContractGroup* group = nullptr) = 0;
        virtual void notifyGroupDestroyed(WorkContractGroup* group) = 0;
        /// False while no thread is available to run scheduled contracts
        virtual bool isAcceptingWork() const noexcept = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane

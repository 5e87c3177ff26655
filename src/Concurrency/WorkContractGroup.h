/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file WorkContractGroup.h
 * @brief Bounded pool of schedulable work contracts
 *
 * A WorkContractGroup owns a fixed number of contract slots. Callers create a
 * contract from a callable, schedule it, and either let a WorkService pick it up or
 * drain the group themselves with executeAllBackgroundWork().
 *
 * @code
 * WorkContractGroup group(128, "Scan");
 * for (auto& dir : dirs) {
 *     group.createContract([dir]{ scan(dir); }).schedule();
 * }
 * group.executeAllBackgroundWork();   // no WorkService attached
 * group.wait();
 * @endcode
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "WorkContractHandle.h"

namespace TwinPane {
namespace Core {
namespace Concurrency {

    class IConcurrencyProvider;

    class WorkContractGroup {
    public:
        /**
         * @brief Creates a group with a fixed number of contract slots
         * @param capacity Maximum simultaneously allocated contracts (at least 1)
         * @param name Label used in log output
         */
        WorkContractGroup(size_t capacity, std::string name = "WorkContractGroup");
        ~WorkContractGroup();

        WorkContractGroup(const WorkContractGroup&) = delete;
        WorkContractGroup& operator=(const WorkContractGroup&) = delete;

        /**
         * @brief Allocates a contract slot for the given work
         * @return A valid handle, or an invalid one when the group is full or stopping
         */
        WorkContractHandle createContract(std::function<void()> work);

        ScheduleResult scheduleContract(const WorkContractHandle& handle);
        ScheduleResult unscheduleContract(const WorkContractHandle& handle);
        /**
         * @brief Frees an allocated or scheduled contract without running it
         * @return true if the slot was freed; false for stale handles and for contracts
         *         that are already executing (those free themselves when they finish)
         */
        bool releaseContract(const WorkContractHandle& handle);

        bool isValidHandle(const WorkContractHandle& handle) const noexcept;
        ContractState getContractState(const WorkContractHandle& handle) const noexcept;

        /**
         * @brief Claims the next scheduled contract for execution
         *
         * The returned handle is in Executing state and must be passed to
         * executeContract(). Returns an invalid handle when nothing is ready.
         */
        WorkContractHandle selectForExecution();

        // Runs a contract claimed by one of the select functions, then frees its slot
        void executeContract(const WorkContractHandle& handle);

        /**
         * @brief Executes scheduled contracts on the calling thread until none remain
         * @return Number of contracts executed
         */
        size_t executeAllBackgroundWork();

        /**
         * @brief Blocks until no contract is scheduled or executing
         *
         * After stop(), waits only for executing contracts. Without a concurrency provider
         * scheduled work is never picked up, so drain first with executeAllBackgroundWork().
         */
        void wait();

        /**
         * @brief Refuses new contracts and selections; executing contracts finish normally
         *
         * Contracts still scheduled are never selected again. Their owners release them
         * with releaseContract().
         */
        void stop();
        bool isStopping() const noexcept { return _stopping.load(std::memory_order_acquire); }

        size_t capacity() const noexcept { return _capacity; }
        size_t activeCount() const noexcept { return _activeCount.load(std::memory_order_acquire); }
        size_t scheduledCount() const noexcept { return _scheduledCount.load(std::memory_order_acquire); }
        size_t executingCount() const noexcept { return _executingCount.load(std::memory_order_acquire); }
        const std::string& name() const noexcept { return _name; }

        void setConcurrencyProvider(IConcurrencyProvider* provider);
        IConcurrencyProvider* getConcurrencyProvider() const;
        bool hasConcurrencyProvider() const { return getConcurrencyProvider() != nullptr; }
        /// True when a provider is attached and currently able to run contracts
        bool hasActiveConcurrencyProvider() const;

    private:
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        struct ContractSlot {
            ContractState state = ContractState::Free;
            uint32_t generation = 1;
            std::function<void()> work;
        };

        bool validateHandleLocked(const WorkContractHandle& handle) const noexcept;
        void freeSlotLocked(uint32_t index);
        void notifyWaiters();

        const size_t _capacity;
        std::string _name;

        mutable std::mutex _slotMutex;
        std::vector<ContractSlot> _contracts;
        std::vector<uint32_t> _freeList;
        std::deque<uint32_t> _readyContracts;

        std::atomic<size_t> _activeCount{0};
        std::atomic<size_t> _scheduledCount{0};
        std::atomic<size_t> _executingCount{0};
        std::atomic<bool> _stopping{false};

        std::mutex _waitMutex;
        std::condition_variable _waitCondition;

        mutable std::shared_mutex _concurrencyProviderMutex;
        IConcurrencyProvider* _concurrencyProvider = nullptr;
    };

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane

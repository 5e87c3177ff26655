/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file WorkContractHandle.h
 * @brief Generation-checked handle for scheduling and managing work contracts
 *
 * A WorkContractHandle is stamped with (owner + index + generation) by its
 * WorkContractGroup. The group is the source of truth: once a slot is executed or
 * released its generation advances and every outstanding handle to it goes stale.
 */

#pragma once

#include <cstdint>
#include <string>

namespace TwinPane {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    /**
     * @brief States that a work contract can be in during its lifecycle
     */
    enum class ContractState : uint32_t {
        Free = 0,       ///< Contract slot is available for allocation
        Allocated = 1,  ///< Contract has been allocated but not scheduled
        Scheduled = 2,  ///< Contract is scheduled and ready for execution
        Executing = 3,  ///< Contract is currently being executed
        Completed = 4   ///< Contract has completed execution
    };

    /**
     * @brief Result of schedule/unschedule operations
     */
    enum class ScheduleResult {
        Scheduled,         ///< Contract is now scheduled
        AlreadyScheduled,  ///< Contract was already scheduled
        NotScheduled,      ///< Contract is not scheduled (successful unschedule)
        Executing,         ///< Cannot modify - currently executing
        Invalid            ///< Stale or empty handle
    };

    /**
     * @class WorkContractHandle
     * @brief Value handle naming one contract slot of a WorkContractGroup
     *
     * Copying a handle copies only its identity; the group owns the slot.
     *
     * Typical workflow:
     * 1. Create via WorkContractGroup::createContract()
     * 2. Call schedule(), optionally unschedule()
     * 3. After execution starts or release(), valid() becomes false
     *
     * @code
     * WorkContractGroup group(64, "Copy");
     * auto h = group.createContract([]{ copyOneFile(); });
     * if (h.schedule() == ScheduleResult::Scheduled) { // queued }
     * @endcode
     */
    class WorkContractHandle {
    public:
        // Default: invalid (no stamped identity)
        WorkContractHandle() = default;

        /**
         * @brief Schedules this contract for execution
         *
         * Transitions Allocated -> Scheduled.
         * @return Scheduled, AlreadyScheduled, Executing, or Invalid
         */
        ScheduleResult schedule();

        /**
         * @brief Attempts to remove this contract from the ready set
         *
         * Succeeds only when in Scheduled state; cannot cancel while Executing.
         * @return NotScheduled on success, Executing if too late, or Invalid
         */
        ScheduleResult unschedule();

        /**
         * @brief Checks whether this handle still refers to a live slot
         */
        bool valid() const;

        /**
         * @brief Immediately frees this contract's slot
         *
         * Only Allocated or Scheduled contracts are released. After this, valid() is false.
         * @return true if the work was dropped without running
         */
        bool release();

        bool isScheduled() const;
        bool isExecuting() const;

        WorkContractGroup* owner() const noexcept { return _owner; }
        uint32_t index() const noexcept { return _index; }
        uint32_t generation() const noexcept { return _generation; }

        std::string toString() const;

        bool operator==(const WorkContractHandle& other) const noexcept {
            return _owner == other._owner && _index == other._index && _generation == other._generation;
        }

    private:
        friend class WorkContractGroup;

        WorkContractHandle(WorkContractGroup* group, uint32_t index, uint32_t generation)
            : _owner(group)
            , _index(index)
            , _generation(generation) {
        }

        WorkContractGroup* _owner = nullptr;
        uint32_t _index = 0;
        uint32_t _generation = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane

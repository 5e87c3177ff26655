/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "WorkContractGroup.h"
#include "IConcurrencyProvider.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>

namespace TwinPane {
namespace Core {
namespace Concurrency {

    WorkContractGroup::WorkContractGroup(size_t capacity, std::string name)
        : _capacity(std::max<size_t>(capacity, 1))
        , _name(std::move(name))
        , _contracts(_capacity) {
        // Lowest index is handed out first
        _freeList.reserve(_capacity);
        for (size_t i = _capacity; i > 0; --i) {
            _freeList.push_back(static_cast<uint32_t>(i - 1));
        }
    }

    WorkContractGroup::~WorkContractGroup() {
        // Stop accepting new work first, then let executing contracts finish
        stop();
        wait();

        size_t abandoned = 0;
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            _readyContracts.clear();
            for (uint32_t i = 0; i < _capacity; ++i) {
                auto& slot = _contracts[i];
                if (slot.state == ContractState::Allocated || slot.state == ContractState::Scheduled) {
                    freeSlotLocked(i);
                    ++abandoned;
                }
            }
            _scheduledCount.store(0, std::memory_order_release);
            _activeCount.store(0, std::memory_order_release);
        }

        if (abandoned > 0) {
            TWINPANE_LOG_DEBUG_CAT("Concurrency",
                std::format("WorkContractGroup '{}' destroyed with {} unexecuted contracts", _name, abandoned));
        }

        IConcurrencyProvider* provider = nullptr;
        {
            std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
            provider = _concurrencyProvider;
            _concurrencyProvider = nullptr;
        }

        if (provider) {
            provider->notifyGroupDestroyed(this);
        }
    }

    WorkContractHandle WorkContractGroup::createContract(std::function<void()> work) {
        if (_stopping.load(std::memory_order_acquire)) {
            return WorkContractHandle();
        }

        std::lock_guard<std::mutex> lock(_slotMutex);
        if (_freeList.empty()) {
            return WorkContractHandle(); // No free slots available
        }

        const uint32_t index = _freeList.back();
        _freeList.pop_back();

        auto& slot = _contracts[index];
        slot.work = [fn = std::move(work)]() noexcept {
            if (fn) fn();
        };
        slot.state = ContractState::Allocated;
        _activeCount.fetch_add(1, std::memory_order_acq_rel);

        return WorkContractHandle(this, index, slot.generation);
    }

    ScheduleResult WorkContractGroup::scheduleContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!validateHandleLocked(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle.index()];
            switch (slot.state) {
                case ContractState::Allocated:
                    break;
                case ContractState::Scheduled:
                    return ScheduleResult::AlreadyScheduled;
                case ContractState::Executing:
                    return ScheduleResult::Executing;
                default:
                    return ScheduleResult::Invalid;
            }

            slot.state = ContractState::Scheduled;
            _readyContracts.push_back(handle.index());
            _scheduledCount.fetch_add(1, std::memory_order_acq_rel);
        }

        {
            std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
            if (_concurrencyProvider) {
                _concurrencyProvider->notifyWorkAvailable(this);
            }
        }

        return ScheduleResult::Scheduled;
    }

    ScheduleResult WorkContractGroup::unscheduleContract(const WorkContractHandle& handle) {
        size_t remaining = 1;
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!validateHandleLocked(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle.index()];
            if (slot.state == ContractState::Executing) return ScheduleResult::Executing;
            if (slot.state == ContractState::Allocated) return ScheduleResult::NotScheduled;
            if (slot.state != ContractState::Scheduled) return ScheduleResult::Invalid;

            slot.state = ContractState::Allocated;
            std::erase(_readyContracts, handle.index());
            remaining = _scheduledCount.fetch_sub(1, std::memory_order_acq_rel) - 1;
        }

        // Notify waiters if nothing is scheduled anymore
        if (remaining == 0) {
            notifyWaiters();
        }
        return ScheduleResult::NotScheduled;
    }

    bool WorkContractGroup::releaseContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!validateHandleLocked(handle)) return false;

            const uint32_t index = handle.index();
            auto& slot = _contracts[index];
            if (slot.state == ContractState::Scheduled) {
                std::erase(_readyContracts, index);
                _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            } else if (slot.state != ContractState::Allocated) {
                // Executing contracts free themselves when they finish
                return false;
            }

            freeSlotLocked(index);
            _activeCount.fetch_sub(1, std::memory_order_acq_rel);
        }
        notifyWaiters();
        return true;
    }

    bool WorkContractGroup::isValidHandle(const WorkContractHandle& handle) const noexcept {
        std::lock_guard<std::mutex> lock(_slotMutex);
        if (!validateHandleLocked(handle)) return false;
        const auto state = _contracts[handle.index()].state;
        return state == ContractState::Allocated || state == ContractState::Scheduled;
    }

    ContractState WorkContractGroup::getContractState(const WorkContractHandle& handle) const noexcept {
        std::lock_guard<std::mutex> lock(_slotMutex);
        if (!validateHandleLocked(handle)) return ContractState::Free;
        return _contracts[handle.index()].state;
    }

    WorkContractHandle WorkContractGroup::selectForExecution() {
        std::lock_guard<std::mutex> lock(_slotMutex);
        if (_stopping.load(std::memory_order_acquire)) {
            return WorkContractHandle();
        }

        while (!_readyContracts.empty()) {
            const uint32_t index = _readyContracts.front();
            _readyContracts.pop_front();

            auto& slot = _contracts[index];
            if (slot.state != ContractState::Scheduled) {
                continue;
            }

            slot.state = ContractState::Executing;
            _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            _executingCount.fetch_add(1, std::memory_order_acq_rel);
            return WorkContractHandle(this, index, slot.generation);
        }
        return WorkContractHandle();
    }

    void WorkContractGroup::executeContract(const WorkContractHandle& handle) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!validateHandleLocked(handle)) return;
            auto& slot = _contracts[handle.index()];
            if (slot.state != ContractState::Executing) return;
            task = std::move(slot.work);
            slot.work = nullptr;
        }

        if (task) {
            task();
        }

        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            freeSlotLocked(handle.index());
        }

        _executingCount.fetch_sub(1, std::memory_order_acq_rel);
        _activeCount.fetch_sub(1, std::memory_order_acq_rel);
        notifyWaiters();
    }

    size_t WorkContractGroup::executeAllBackgroundWork() {
        size_t executed = 0;
        while (true) {
            WorkContractHandle handle = selectForExecution();
            if (!handle.owner()) {
                break;
            }
            executeContract(handle);
            ++executed;
        }
        return executed;
    }

    void WorkContractGroup::stop() {
        _stopping.store(true, std::memory_order_release);
        notifyWaiters();
    }

    void WorkContractGroup::wait() {
        std::unique_lock<std::mutex> lock(_waitMutex);
        _waitCondition.wait(lock, [this]() {
            const bool idle = _executingCount.load(std::memory_order_acquire) == 0;
            if (_stopping.load(std::memory_order_acquire)) {
                return idle;
            }
            return idle && _scheduledCount.load(std::memory_order_acquire) == 0;
        });
    }

    void WorkContractGroup::setConcurrencyProvider(IConcurrencyProvider* provider) {
        std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        _concurrencyProvider = provider;
    }

    IConcurrencyProvider* WorkContractGroup::getConcurrencyProvider() const {
        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        return _concurrencyProvider;
    }

    bool WorkContractGroup::hasActiveConcurrencyProvider() const {
        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        return _concurrencyProvider && _concurrencyProvider->isAcceptingWork();
    }

    bool WorkContractGroup::validateHandleLocked(const WorkContractHandle& handle) const noexcept {
        if (handle.owner() != this) return false;
        if (handle.index() >= _capacity) return false;
        const auto& slot = _contracts[handle.index()];
        return slot.state != ContractState::Free && slot.generation == handle.generation();
    }

    void WorkContractGroup::freeSlotLocked(uint32_t index) {
        auto& slot = _contracts[index];
        slot.work = nullptr;
        ++slot.generation;
        slot.state = ContractState::Free;
        _freeList.push_back(index);
    }

    void WorkContractGroup::notifyWaiters() {
        std::lock_guard<std::mutex> lock(_waitMutex);
        _waitCondition.notify_all();
    }

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane

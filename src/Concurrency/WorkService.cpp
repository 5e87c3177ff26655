/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "WorkService.h"
#include "WorkContractGroup.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>

namespace TwinPane {
namespace Core {
namespace Concurrency {

    WorkService::WorkService(Config config)
        : _config(config) {
        _threadCount = _config.threadCount;
        if (_threadCount == 0) {
            _threadCount = std::max<size_t>(std::thread::hardware_concurrency(), 1);
        }
    }

    WorkService::~WorkService() {
        stop();
        clear();
    }

    void WorkService::start() {
        bool expected = false;
        if (!_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }

        _workers.reserve(_threadCount);
        for (size_t i = 0; i < _threadCount; ++i) {
            _workers.emplace_back([this, i] { workerLoop(i); });
        }
        TWINPANE_LOG_DEBUG_CAT("Concurrency", std::format("WorkService started with {} threads", _threadCount));
    }

    void WorkService::stop() {
        bool expected = true;
        if (!_running.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeEpoch;
        }
        _wakeCondition.notify_all();

        for (auto& worker : _workers) {
            if (worker.joinable()) worker.join();
        }
        _workers.clear();
        TWINPANE_LOG_DEBUG_CAT("Concurrency", "WorkService stopped");
    }

    WorkService::GroupOperationStatus WorkService::addWorkContractGroup(WorkContractGroup* group) {
        if (!group) return GroupOperationStatus::NotFound;
        {
            std::unique_lock<std::shared_mutex> lock(_groupsMutex);
            if (std::find(_groups.begin(), _groups.end(), group) != _groups.end()) {
                return GroupOperationStatus::Exists;
            }
            if (_groups.size() >= _config.maxWorkGroups) {
                return GroupOperationStatus::OutOfSpace;
            }
            _groups.push_back(group);
        }

        group->setConcurrencyProvider(this);
        // Pick up anything scheduled before registration
        notifyWorkAvailable(group);
        return GroupOperationStatus::Added;
    }

    WorkService::GroupOperationStatus WorkService::removeWorkContractGroup(WorkContractGroup* group) {
        {
            // Exclusive lock waits for any worker still executing from this group
            std::unique_lock<std::shared_mutex> lock(_groupsMutex);
            auto it = std::find(_groups.begin(), _groups.end(), group);
            if (it == _groups.end()) {
                return GroupOperationStatus::NotFound;
            }
            _groups.erase(it);
        }

        if (group->getConcurrencyProvider() == this) {
            group->setConcurrencyProvider(nullptr);
        }
        return GroupOperationStatus::Removed;
    }

    void WorkService::clear() {
        std::vector<WorkContractGroup*> removed;
        {
            std::unique_lock<std::shared_mutex> lock(_groupsMutex);
            removed.swap(_groups);
        }
        for (auto* group : removed) {
            if (group->getConcurrencyProvider() == this) {
                group->setConcurrencyProvider(nullptr);
            }
        }
    }

    size_t WorkService::getWorkContractGroupCount() const {
        std::shared_lock<std::shared_mutex> lock(_groupsMutex);
        return _groups.size();
    }

    void WorkService::notifyWorkAvailable(WorkContractGroup* /*group*/) {
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeEpoch;
        }
        _wakeCondition.notify_one();
    }

    void WorkService::notifyGroupDestroyed(WorkContractGroup* group) {
        std::unique_lock<std::shared_mutex> lock(_groupsMutex);
        std::erase(_groups, group);
    }

    bool WorkService::executeOne(size_t& cursor) {
        std::shared_lock<std::shared_mutex> lock(_groupsMutex);
        const size_t count = _groups.size();
        for (size_t attempt = 0; attempt < count; ++attempt) {
            WorkContractGroup* group = _groups[(cursor + attempt) % count];
            auto handle = group->selectForExecution();
            if (handle.owner()) {
                group->executeContract(handle);
                // Rotate so one busy group cannot starve the others
                cursor = (cursor + attempt + 1) % count;
                return true;
            }
        }
        return false;
    }

    void WorkService::workerLoop(size_t workerIndex) {
        size_t cursor = workerIndex;
        while (_running.load(std::memory_order_acquire)) {
            uint64_t observedEpoch = 0;
            {
                std::lock_guard<std::mutex> lock(_wakeMutex);
                observedEpoch = _wakeEpoch;
            }

            if (executeOne(cursor)) {
                continue;
            }

            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wakeCondition.wait_for(lock, _config.idleWait, [this, observedEpoch] {
                return _wakeEpoch != observedEpoch || !_running.load(std::memory_order_acquire);
            });
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane

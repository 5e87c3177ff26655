/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file WorkService.h
 * @brief Thread pool that executes contracts from registered WorkContractGroups
 *
 * Workers rotate over the registered groups and execute whatever AnyThread contracts
 * are scheduled. Registering a group installs the service as the group's
 * IConcurrencyProvider so that scheduling wakes an idle worker.
 *
 * @code
 * WorkService service(WorkService::Config{});
 * WorkContractGroup group(256, "FileOps");
 * service.start();
 * service.addWorkContractGroup(&group);
 * // ... schedule contracts ...
 * service.removeWorkContractGroup(&group);
 * service.stop();
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "IConcurrencyProvider.h"

namespace TwinPane {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    class WorkService : public IConcurrencyProvider {
    public:
        struct Config {
            size_t threadCount;      ///< Worker threads; 0 selects std::thread::hardware_concurrency()
            size_t maxWorkGroups;    ///< Upper bound on registered groups
            std::chrono::milliseconds idleWait;  ///< Longest a worker sleeps without a wake-up

            Config()
                : threadCount(0)
                , maxWorkGroups(64)
                , idleWait(10) {}
        };

        enum class GroupOperationStatus {
            Added,
            Removed,
            Exists,
            NotFound,
            OutOfSpace
        };

        explicit WorkService(Config config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        void start();
        /**
         * @brief Joins all workers
         *
         * Contracts that are executing finish; scheduled contracts stay scheduled in
         * their groups. Groups stay registered but report no active provider until
         * start() is called again, so their owners can drain them.
         */
        void stop();
        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

        GroupOperationStatus addWorkContractGroup(WorkContractGroup* group);
        GroupOperationStatus removeWorkContractGroup(WorkContractGroup* group);
        // Unregisters every group without stopping the workers
        void clear();

        size_t getWorkContractGroupCount() const;
        size_t getThreadCount() const noexcept { return _threadCount; }

        void notifyWorkAvailable(WorkContractGroup* group = nullptr) override;
        void notifyGroupDestroyed(WorkContractGroup* group) override;
        bool isAcceptingWork() const noexcept override { return isRunning(); }

    private:
        void workerLoop(size_t workerIndex);
        bool executeOne(size_t& cursor);

        Config _config;
        size_t _threadCount = 0;

        std::atomic<bool> _running{false};
        std::vector<std::thread> _workers;

        mutable std::shared_mutex _groupsMutex;
        std::vector<WorkContractGroup*> _groups;

        std::mutex _wakeMutex;
        std::condition_variable _wakeCondition;
        uint64_t _wakeEpoch = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "Concurrency/CancellationToken.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkService.h"

using namespace TwinPane::Core::Concurrency;

TEST(WorkService, ExecutesScheduledContractsOnWorkers) {
    WorkService::Config config;
    config.threadCount = 2;
    WorkService service(config);
    WorkContractGroup group(128, "ServiceTest");
    service.start();
    ASSERT_EQ(service.addWorkContractGroup(&group), WorkService::GroupOperationStatus::Added);
    EXPECT_TRUE(group.hasConcurrencyProvider());

    std::atomic<int> executed{0};
    const auto caller = std::this_thread::get_id();
    std::atomic<bool> ranElsewhere{true};
    for (int i = 0; i < 64; ++i) {
        group.createContract([&] {
            if (std::this_thread::get_id() == caller) ranElsewhere = false;
            ++executed;
        }).schedule();
    }
    group.wait();

    EXPECT_EQ(executed.load(), 64);
    EXPECT_TRUE(ranElsewhere.load());
    EXPECT_EQ(service.getThreadCount(), 2u);

    EXPECT_EQ(service.removeWorkContractGroup(&group), WorkService::GroupOperationStatus::Removed);
    EXPECT_EQ(service.removeWorkContractGroup(&group), WorkService::GroupOperationStatus::NotFound);
    EXPECT_FALSE(group.hasConcurrencyProvider());
    service.stop();
    EXPECT_FALSE(service.isRunning());
}

TEST(WorkService, GroupRegistrationIsTracked) {
    WorkService service(WorkService::Config{});
    WorkContractGroup a(4, "A");
    WorkContractGroup b(4, "B");

    EXPECT_EQ(service.addWorkContractGroup(&a), WorkService::GroupOperationStatus::Added);
    EXPECT_EQ(service.addWorkContractGroup(&a), WorkService::GroupOperationStatus::Exists);
    EXPECT_EQ(service.addWorkContractGroup(&b), WorkService::GroupOperationStatus::Added);
    EXPECT_EQ(service.getWorkContractGroupCount(), 2u);

    service.clear();
    EXPECT_EQ(service.getWorkContractGroupCount(), 0u);
}

TEST(WorkService, DestroyedGroupUnregistersItself) {
    WorkService service(WorkService::Config{});
    service.start();
    {
        WorkContractGroup group(4, "ShortLived");
        service.addWorkContractGroup(&group);
        EXPECT_EQ(service.getWorkContractGroupCount(), 1u);
    }
    EXPECT_EQ(service.getWorkContractGroupCount(), 0u);
    service.stop();
}

TEST(WorkService, FullServiceReportsOutOfSpace) {
    WorkService::Config config;
    config.maxWorkGroups = 1;
    WorkService service(config);
    WorkContractGroup a(4, "A");
    WorkContractGroup b(4, "B");

    EXPECT_EQ(service.addWorkContractGroup(&a), WorkService::GroupOperationStatus::Added);
    EXPECT_EQ(service.addWorkContractGroup(&b), WorkService::GroupOperationStatus::OutOfSpace);
    EXPECT_FALSE(b.hasConcurrencyProvider());
    service.clear();
}

TEST(WorkService, HeapGroupRemovedBeforeDelete) {
    WorkService service(WorkService::Config{});
    service.start();
    auto* group = new WorkContractGroup(32, "Heap");
    ASSERT_EQ(service.addWorkContractGroup(group), WorkService::GroupOperationStatus::Added);
    EXPECT_EQ(service.removeWorkContractGroup(group), WorkService::GroupOperationStatus::Removed);
    EXPECT_EQ(service.getWorkContractGroupCount(), 0u);
    EXPECT_FALSE(group->hasConcurrencyProvider());

    delete group;
    service.stop();
}

TEST(WorkService, ExecutingContractIsNotStartedTwice) {
    WorkService::Config config;
    config.threadCount = 4;
    WorkService service(config);
    WorkContractGroup group(8, "NoReentry");
    service.start();
    service.addWorkContractGroup(&group);

    std::atomic<bool> release{false};
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};

    auto handle = group.createContract([&] {
        int now = ++running;
        int seen = maxRunning.load();
        while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {}
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        --running;
    });
    ASSERT_EQ(handle.schedule(), ScheduleResult::Scheduled);

    while (!handle.isExecuting()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    EXPECT_EQ(handle.schedule(), ScheduleResult::Executing);
    EXPECT_EQ(handle.unschedule(), ScheduleResult::Executing);
    EXPECT_FALSE(group.releaseContract(handle));

    release = true;
    group.wait();
    EXPECT_EQ(maxRunning.load(), 1);
    EXPECT_FALSE(handle.valid());

    service.removeWorkContractGroup(&group);
    service.stop();
}

TEST(WorkService, StoppedServiceReportsNoActiveProvider) {
    WorkService::Config config;
    config.threadCount = 1;
    WorkService service(config);
    WorkContractGroup group(8, "Idle");
    service.addWorkContractGroup(&group);
    EXPECT_TRUE(group.hasConcurrencyProvider());
    EXPECT_FALSE(group.hasActiveConcurrencyProvider());

    service.start();
    EXPECT_TRUE(group.hasActiveConcurrencyProvider());
    service.stop();
    EXPECT_TRUE(group.hasConcurrencyProvider());
    EXPECT_FALSE(group.hasActiveConcurrencyProvider());

    std::atomic<int> executed{0};
    ASSERT_EQ(group.createContract([&] { ++executed; }).schedule(), ScheduleResult::Scheduled);
    EXPECT_EQ(group.executeAllBackgroundWork(), 1u);
    EXPECT_EQ(executed.load(), 1);

    service.removeWorkContractGroup(&group);
}

TEST(CancellationToken, SourceSignalsAllTokens) {
    CancellationSource source;
    auto a = source.token();
    auto b = a;

    EXPECT_TRUE(a.canBeCancelled());
    EXPECT_FALSE(b.isCancellationRequested());
    source.cancel();
    EXPECT_TRUE(a.isCancellationRequested());
    EXPECT_TRUE(b.isCancellationRequested());

    source.reset();
    EXPECT_FALSE(source.isCancellationRequested());
    EXPECT_TRUE(a.isCancellationRequested());
    EXPECT_FALSE(source.token().isCancellationRequested());
}

TEST(CancellationToken, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_FALSE(token.isCancellationRequested());
}

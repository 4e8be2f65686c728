#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include "Concurrency/WorkContractGroup.h"

using namespace Courier::Core::Concurrency;

TEST(WorkContractGroupAccounting, ScheduleAndExecute_AllCountersReturnToZero) {
    WorkContractGroup group(256, "AcctTest");
    std::atomic<int> executed{0};

    const int N = 50;
    for (int i = 0; i < N; ++i) {
        auto h = group.createContract([&executed]() noexcept { executed.fetch_add(1, std::memory_order_relaxed); });
        auto res = h.schedule();
        ASSERT_TRUE(res == ScheduleResult::Scheduled || res == ScheduleResult::AlreadyScheduled);
    }

    // Execute on calling thread deterministically
    group.executeAllBackgroundWork();
    group.wait();

    EXPECT_EQ(executed.load(), N);
    EXPECT_EQ(group.scheduledCount(), 0u);
    EXPECT_EQ(group.executingCount(), 0u);
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(WorkContractGroupAccounting, FullGroupHandsOutInvalidHandles) {
    WorkContractGroup group(2, "Tiny");
    auto a = group.createContract([] {});
    auto b = group.createContract([] {});
    auto c = group.createContract([] {});

    EXPECT_TRUE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_FALSE(c.valid());
    EXPECT_EQ(group.activeCount(), 2u);

    a.release();
    EXPECT_FALSE(a.valid());
    EXPECT_EQ(group.activeCount(), 1u);
    EXPECT_TRUE(group.createContract([] {}).valid());
}

TEST(WorkContractGroupAccounting, ReleasedSlotInvalidatesStaleHandle) {
    WorkContractGroup group(1, "Reuse");
    auto first = group.createContract([] {});
    first.release();
    auto second = group.createContract([] {});

    EXPECT_EQ(first.index(), second.index());
    EXPECT_NE(first.generation(), second.generation());
    EXPECT_FALSE(first.valid());
    EXPECT_EQ(first.schedule(), ScheduleResult::Invalid);
    EXPECT_TRUE(second.valid());
}

TEST(WorkContractGroupAccounting, UnscheduleReturnsContractToAllocated) {
    WorkContractGroup group(4, "Unschedule");
    bool ran = false;
    auto h = group.createContract([&ran] { ran = true; });

    EXPECT_EQ(h.schedule(), ScheduleResult::Scheduled);
    EXPECT_EQ(h.schedule(), ScheduleResult::AlreadyScheduled);
    EXPECT_EQ(h.unschedule(), ScheduleResult::NotScheduled);
    EXPECT_EQ(group.scheduledCount(), 0u);
    EXPECT_EQ(group.executeAllBackgroundWork(), 0u);
    EXPECT_FALSE(ran);

    h.release();
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(WorkContractGroupAccounting, ThrowingContractStillFreesItsSlot) {
    WorkContractGroup group(1, "Throws");
    auto h = group.createContract([] { throw std::runtime_error("contract failure"); });
    ASSERT_EQ(h.schedule(), ScheduleResult::Scheduled);

    EXPECT_EQ(group.executeAllBackgroundWork(), 1u);
    EXPECT_EQ(group.activeCount(), 0u);
    EXPECT_TRUE(group.createContract([] {}).valid());
}

TEST(WorkContractGroupAccounting, NonStandardThrowIsContainedAndLaterWorkRuns) {
    WorkContractGroup group(2, "ThrowsInt");
    std::atomic<int> executed{0};
    auto bad = group.createContract([] { throw 7; });
    auto good = group.createContract([&executed] { executed.fetch_add(1, std::memory_order_relaxed); });
    ASSERT_EQ(bad.schedule(), ScheduleResult::Scheduled);
    ASSERT_EQ(good.schedule(), ScheduleResult::Scheduled);

    EXPECT_EQ(group.executeAllBackgroundWork(), 2u);
    group.wait();
    EXPECT_EQ(executed.load(), 1);
    EXPECT_EQ(group.executingCount(), 0u);
    EXPECT_EQ(group.activeCount(), 0u);
}

/**
 * @file observer_list_tests.cpp
 * Unit tests for incrgraph::ObserverList
 */
#include <gtest/gtest.h>
#include "incrgraph/common/observer_list.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace incrgraph;

// ============================================================================
// Registration
// ============================================================================

TEST(ObserverListTests, Construction_DefaultIsEmpty)
{
    ObserverList list;
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.size(), 0u);
    EXPECT_TRUE(list.slots().empty());
}

TEST(ObserverListTests, Add_ReturnsDistinctSlots)
{
    ObserverList list;
    SlotId a = list.add([] {});
    SlotId b = list.add([] {});
    EXPECT_NE(a, b);
    EXPECT_EQ(list.size(), 2u);
    EXPECT_TRUE(list.contains(a));
    EXPECT_TRUE(list.contains(b));
}

TEST(ObserverListTests, Add_EmptyCallbackThrows)
{
    ObserverList list;
    EXPECT_THROW(list.add(ObserverList::Callback{}), std::invalid_argument);
    EXPECT_TRUE(list.empty());
}

TEST(ObserverListTests, Slots_AreInRegistrationOrder)
{
    ObserverList list;
    SlotId a = list.add([] {});
    SlotId b = list.add([] {});
    SlotId c = list.add([] {});
    EXPECT_EQ(list.slots(), (std::vector<SlotId>{a, b, c}));
}

// ============================================================================
// Removal
// ============================================================================

TEST(ObserverListTests, Remove_RemovesOnlyThatSlot)
{
    ObserverList list;
    SlotId a = list.add([] {});
    SlotId b = list.add([] {});
    SlotId c = list.add([] {});

    EXPECT_TRUE(list.remove(b));
    EXPECT_EQ(list.slots(), (std::vector<SlotId>{a, c}));
    EXPECT_FALSE(list.contains(b));
}

TEST(ObserverListTests, Remove_TwiceReturnsFalse)
{
    ObserverList list;
    SlotId a = list.add([] {});
    EXPECT_TRUE(list.remove(a));
    EXPECT_FALSE(list.remove(a));
}

TEST(ObserverListTests, Remove_DuplicateCallableKeepsOtherRegistration)
{
    int calls = 0;
    auto callback = std::make_shared<std::function<void()>>([&calls] { ++calls; });
    ObserverList list;
    SlotId first = list.add([callback] { (*callback)(); });
    SlotId second = list.add([callback] { (*callback)(); });

    list.remove(first);
    for (SlotId slot : list.slots())
    {
        list.invoke(slot);
    }
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(list.contains(second));
}

TEST(ObserverListTests, Slots_NotReusedAfterRemoval)
{
    ObserverList list;
    SlotId a = list.add([] {});
    list.remove(a);
    SlotId b = list.add([] {});
    EXPECT_NE(a, b);
}

TEST(ObserverListTests, Clear_RemovesEverything)
{
    ObserverList list;
    SlotId a = list.add([] {});
    list.add([] {});
    list.clear();
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.contains(a));
}

// ============================================================================
// Invocation
// ============================================================================

TEST(ObserverListTests, Invoke_CallsRegisteredCallback)
{
    std::vector<std::string> log;
    ObserverList list;
    SlotId a = list.add([&log] { log.push_back("a"); });
    SlotId b = list.add([&log] { log.push_back("b"); });

    EXPECT_TRUE(list.invoke(b));
    EXPECT_TRUE(list.invoke(a));
    EXPECT_EQ(log, (std::vector<std::string>{"b", "a"}));
}

TEST(ObserverListTests, Invoke_RemovedSlotReturnsFalse)
{
    int calls = 0;
    ObserverList list;
    SlotId a = list.add([&calls] { ++calls; });
    list.remove(a);
    EXPECT_FALSE(list.invoke(a));
    EXPECT_EQ(calls, 0);
}

TEST(ObserverListTests, Invoke_CallbackMayRemoveItself)
{
    int calls = 0;
    ObserverList list;
    SlotId self = 0;
    self = list.add([&] {
        ++calls;
        list.remove(self);
    });

    EXPECT_TRUE(list.invoke(self));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(list.empty());
}

TEST(ObserverListTests, SnapshotDispatch_SkipsSlotsRemovedDuringDispatch)
{
    std::vector<std::string> log;
    ObserverList list;
    SlotId b = 0;
    list.add([&] {
        log.push_back("a");
        list.remove(b);
    });
    b = list.add([&] { log.push_back("b"); });
    list.add([&] { log.push_back("c"); });

    for (SlotId slot : list.slots())
    {
        list.invoke(slot);
    }
    EXPECT_EQ(log, (std::vector<std::string>{"a", "c"}));
}

TEST(ObserverListTests, SnapshotDispatch_ExcludesSlotsAddedDuringDispatch)
{
    int late_calls = 0;
    ObserverList list;
    list.add([&] { list.add([&late_calls] { ++late_calls; }); });

    for (SlotId slot : list.slots())
    {
        list.invoke(slot);
    }
    EXPECT_EQ(late_calls, 0);
    EXPECT_EQ(list.size(), 2u);
}

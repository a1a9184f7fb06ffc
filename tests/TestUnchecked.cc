#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "xjb-core/unchecked.hh"

///
/// UNCHECKED OPTION TESTS
/// - misuse is only detected in debug builds
///

TEST(UncheckedOptionTests, SetGetTake) {
    xjb::UncheckedOption<std::string> slot;
    slot.set("first");
    EXPECT_EQ(slot.get_ref(), "first");

    slot.get_mut() += "-edited";
    EXPECT_EQ(slot.get_ref(), "first-edited");

    std::string taken = slot.take();
    EXPECT_EQ(taken, "first-edited");

    // an emptied slot can be refilled
    slot.set("second");
    EXPECT_EQ(slot.take(), "second");
}

TEST(UncheckedOptionTests, ConstructedFull) {
    xjb::UncheckedOption<std::vector<int>> slot{std::vector<int>{1, 2, 3}};
    EXPECT_EQ(slot.get_ref().size(), 3);
    std::vector<int> taken = slot.take();
    EXPECT_EQ(taken.back(), 3);
}

#if XJB_CONFIG_DEBUG_MODE

TEST(UncheckedOptionTests, MisuseThrowsInDebugBuilds) {
    xjb::UncheckedOption<int> slot;
    EXPECT_THROW(slot.take(), xjb::Error);
    EXPECT_THROW(slot.get_ref(), xjb::Error);
    EXPECT_THROW(slot.get_mut(), xjb::Error);

    slot.set(1);
    EXPECT_THROW(slot.set(2), xjb::Error);
    EXPECT_EQ(slot.get_ref(), 1);
    EXPECT_EQ(slot.take(), 1);
}

#endif

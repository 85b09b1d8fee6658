#include <gtest/gtest.h>
#include "adapters/display_name_store.h"
#include "test_support.h"
#include <fstream>

using namespace station;
using station::testing_support::TempDir;

class DisplayNameStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::string path_ = dir_.file("terminal_names.json");
};

TEST_F(DisplayNameStoreTest, SetAndGet) {
    DisplayNameStore store(path_);
    EXPECT_FALSE(store.get("p-1", 0).has_value());

    EXPECT_TRUE(store.set("p-1", 0, "planner"));
    auto name = store.get("p-1", 0);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "planner");
    EXPECT_FALSE(store.get("p-1", 1).has_value());
    EXPECT_FALSE(store.get("p-2", 0).has_value());
}

TEST_F(DisplayNameStoreTest, SurvivesReload) {
    {
        DisplayNameStore store(path_);
        store.set("p-1", 0, "planner");
        store.set("p-1", 2, "reviewer");
        store.set("p-2", 1, "tests");
    }

    DisplayNameStore reloaded(path_);
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.get("p-1", 0).value_or(""), "planner");
    EXPECT_EQ(reloaded.get("p-1", 2).value_or(""), "reviewer");
    EXPECT_EQ(reloaded.get("p-2", 1).value_or(""), "tests");
}

TEST_F(DisplayNameStoreTest, ClearRemovesName) {
    DisplayNameStore store(path_);
    store.set("p-1", 0, "planner");
    EXPECT_TRUE(store.clear("p-1", 0));
    EXPECT_FALSE(store.get("p-1", 0).has_value());
    EXPECT_FALSE(store.clear("p-1", 0));

    DisplayNameStore reloaded(path_);
    ASSERT_TRUE(reloaded.load());
    EXPECT_FALSE(reloaded.get("p-1", 0).has_value());
}

TEST_F(DisplayNameStoreTest, RemoveSlotShiftsLaterNames) {
    DisplayNameStore store(path_);
    store.set("p-1", 0, "first");
    store.set("p-1", 1, "second");
    store.set("p-1", 2, "third");

    EXPECT_TRUE(store.remove_slot("p-1", 1));
    EXPECT_EQ(store.get("p-1", 0).value_or(""), "first");
    EXPECT_EQ(store.get("p-1", 1).value_or(""), "third");
    EXPECT_FALSE(store.get("p-1", 2).has_value());

    EXPECT_FALSE(store.remove_slot("p-1", 5));
    EXPECT_FALSE(store.remove_slot("p-unknown", 0));
}

TEST_F(DisplayNameStoreTest, IgnoresMalformedEntries) {
    std::ofstream(path_) << R"({"p-1": {"0": "ok", "x": "bad key", "1": 5}, "p-2": "not an object"})";

    DisplayNameStore store(path_);
    ASSERT_TRUE(store.load());
    EXPECT_EQ(store.get("p-1", 0).value_or(""), "ok");
    EXPECT_FALSE(store.get("p-1", 1).has_value());
    EXPECT_FALSE(store.get("p-2", 0).has_value());
}

TEST_F(DisplayNameStoreTest, MalformedFileIsReported) {
    std::ofstream(path_) << "{";
    DisplayNameStore store(path_);
    EXPECT_FALSE(store.load());
}

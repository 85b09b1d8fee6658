#include <gtest/gtest.h>
#include "adapters/project_store.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>

using namespace station;
using station::testing_support::TempDir;

class ProjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories(dir_.file("alpha"));
        std::filesystem::create_directories(dir_.file("beta"));
    }

    TempDir dir_;
    std::string store_path_ = dir_.file("projects.json");
};

TEST_F(ProjectStoreTest, AddCanonicalizesAndNames) {
    ProjectStore store(store_path_);
    auto project = store.add(dir_.file("alpha") + "/../alpha/");
    ASSERT_TRUE(project.has_value());

    EXPECT_EQ(project->path, std::filesystem::canonical(dir_.file("alpha")).string());
    EXPECT_EQ(project->name, "alpha");
    EXPECT_EQ(project->id.rfind("p-", 0), 0u);
    EXPECT_EQ(store.projects().size(), 1u);
}

TEST_F(ProjectStoreTest, AddingSameFolderTwiceReturnsExisting) {
    ProjectStore store(store_path_);
    auto first = store.add(dir_.file("alpha"));
    auto second = store.add(dir_.file("alpha") + "/.");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->id, second->id);
    EXPECT_EQ(store.projects().size(), 1u);
}

TEST_F(ProjectStoreTest, RejectsNonDirectories) {
    ProjectStore store(store_path_);
    std::ofstream(dir_.file("plain.txt")) << "x";

    EXPECT_FALSE(store.add(dir_.file("plain.txt")).has_value());
    EXPECT_FALSE(store.add(dir_.file("missing")).has_value());
    EXPECT_TRUE(store.projects().empty());
}

TEST_F(ProjectStoreTest, PersistsAcrossInstances) {
    ProjectId alpha_id;
    {
        ProjectStore store(store_path_);
        alpha_id = store.add(dir_.file("alpha"))->id;
        store.add(dir_.file("beta"));
    }

    ProjectStore reloaded(store_path_);
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.projects().size(), 2u);
    EXPECT_EQ(reloaded.projects()[0].id, alpha_id);
    EXPECT_EQ(reloaded.projects()[0].name, "alpha");
    EXPECT_EQ(reloaded.projects()[1].name, "beta");

    auto found = reloaded.find(alpha_id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "alpha");
}

TEST_F(ProjectStoreTest, RemoveDropsProject) {
    ProjectStore store(store_path_);
    auto alpha = store.add(dir_.file("alpha"));
    store.add(dir_.file("beta"));

    EXPECT_TRUE(store.remove(alpha->id));
    EXPECT_FALSE(store.remove(alpha->id));
    EXPECT_FALSE(store.find(alpha->id).has_value());

    ProjectStore reloaded(store_path_);
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.projects().size(), 1u);
    EXPECT_EQ(reloaded.projects()[0].name, "beta");
}

TEST_F(ProjectStoreTest, IdsAreStablePerPath) {
    EXPECT_EQ(ProjectStore::make_id("/work/a"), ProjectStore::make_id("/work/a"));
    EXPECT_NE(ProjectStore::make_id("/work/a"), ProjectStore::make_id("/work/b"));
}

TEST_F(ProjectStoreTest, MissingFileLoadsEmpty) {
    ProjectStore store(store_path_);
    EXPECT_TRUE(store.load());
    EXPECT_TRUE(store.projects().empty());
}

TEST_F(ProjectStoreTest, MalformedFileIsReported) {
    std::ofstream(store_path_) << "[{\"path\": ";
    ProjectStore store(store_path_);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.projects().empty());
}

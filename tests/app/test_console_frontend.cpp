#include <gtest/gtest.h>
#include "app/console_frontend.h"
#include "adapters/display_name_store.h"
#include "process/session_registry.h"
#include "test_support.h"
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <vector>
#include <unistd.h>

using namespace station;
using station::testing_support::TempDir;
using station::testing_support::sh_config;
using station::testing_support::wait_until;

namespace {

std::string command(char key) {
    return std::string(1, ConsoleFrontend::PREFIX_KEY) + key;
}

}

class ConsoleFrontendTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories(dir_.file("one"));
        std::filesystem::create_directories(dir_.file("two"));
        projects_.push_back(Project{"p-one", dir_.file("one"), "one"});
        projects_.push_back(Project{"p-two", dir_.file("two"), "two"});

        null_fd_ = ::open("/dev/null", O_RDWR);
        ASSERT_GE(null_fd_, 0);
        frontend_ = std::make_unique<ConsoleFrontend>(registry_, names_, null_fd_, null_fd_);
        frontend_->open(projects_);
    }

    void TearDown() override {
        frontend_.reset();
        registry_.shutdown();
        if (null_fd_ >= 0) {
            ::close(null_fd_);
        }
    }

    void type(const std::string& keys) {
        frontend_->handle_input(keys.data(), keys.size());
        frontend_->pump();
    }

    TempDir dir_;
    std::vector<Project> projects_;
    DisplayNameStore names_{dir_.file("terminal_names.json")};
    SessionRegistry registry_{sh_config()};
    int null_fd_ = -1;
    std::unique_ptr<ConsoleFrontend> frontend_;
};

TEST_F(ConsoleFrontendTest, OpensFirstProject) {
    EXPECT_TRUE(frontend_->running());
    ASSERT_TRUE(frontend_->workspace().active_project().has_value());
    EXPECT_EQ(frontend_->workspace().active_project()->id, "p-one");
    EXPECT_EQ(frontend_->workspace().sessions().size(), 1u);
    EXPECT_FALSE(frontend_->view().current().empty());
}

TEST_F(ConsoleFrontendTest, KeystrokesReachTheShell) {
    type("printf 'mark%s\\n' er\r");
    SessionId id = frontend_->view().current();

    EXPECT_TRUE(wait_until([&] {
        frontend_->pump();
        for (const auto& line : frontend_->view().screen_lines()) {
            if (line == "marker") return true;
        }
        return false;
    }));
    EXPECT_EQ(frontend_->view().current(), id);
}

TEST_F(ConsoleFrontendTest, AddCycleAndCloseTerminals) {
    type(command('c'));
    auto ids = frontend_->workspace().sessions();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(frontend_->view().current(), ids[1]);

    type(command('n'));
    EXPECT_EQ(frontend_->view().current(), ids[0]);
    type(command('p'));
    EXPECT_EQ(frontend_->view().current(), ids[1]);

    type(command('x'));
    EXPECT_EQ(frontend_->workspace().sessions().size(), 1u);
    EXPECT_EQ(frontend_->view().current(), ids[0]);

    // The last one stays.
    type(command('x'));
    EXPECT_EQ(frontend_->workspace().sessions().size(), 1u);
}

TEST_F(ConsoleFrontendTest, SwitchingProjectsKeepsSessions) {
    SessionId first = frontend_->view().current();

    type(command(']'));
    EXPECT_EQ(frontend_->workspace().active_project()->id, "p-two");
    SessionId second = frontend_->view().current();
    EXPECT_NE(second, first);

    type(command('['));
    EXPECT_EQ(frontend_->workspace().active_project()->id, "p-one");
    EXPECT_EQ(frontend_->view().current(), first);
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(ConsoleFrontendTest, RenamePrompt) {
    SessionId id = frontend_->view().current();
    type(command('r') + "buil");
    type("x\x7f" "der\r");
    EXPECT_EQ(frontend_->workspace().display_name(id), "builder");

    type(command('r') + "   \r");
    EXPECT_EQ(frontend_->workspace().display_name(id), "builder");

    type(command('r') + "nope\x1b");
    EXPECT_EQ(frontend_->workspace().display_name(id), "builder");
}

TEST_F(ConsoleFrontendTest, QuitStopsLoop) {
    std::string keys = command('q');
    EXPECT_FALSE(frontend_->handle_input(keys.data(), keys.size()));
    EXPECT_FALSE(frontend_->running());
}

TEST_F(ConsoleFrontendTest, UnknownCommandIsIgnored) {
    type(command('z'));
    EXPECT_TRUE(frontend_->running());
    EXPECT_EQ(frontend_->workspace().sessions().size(), 1u);
}

TEST_F(ConsoleFrontendTest, ZoomKeysResizeTheGrid) {
    SessionId id = frontend_->view().current();
    auto session = registry_.find(id);
    ASSERT_NE(session, nullptr);

    // An 80x24 window of 8x16 cells.
    frontend_->view().set_surface(640.0f, 384.0f);
    EXPECT_EQ(frontend_->view().geometry().grid().cols, 80);

    type(command('+'));
    EXPECT_FLOAT_EQ(frontend_->view().geometry().zoom(), 1.1f);
    EXPECT_EQ(frontend_->view().geometry().grid().cols, 72);
    EXPECT_EQ(frontend_->view().geometry().grid().rows, 21);
    int cols = 0;
    int rows = 0;
    ASSERT_TRUE(session->device_size(cols, rows));
    EXPECT_EQ(cols, 72);
    EXPECT_EQ(rows, 21);

    type(command('-'));
    EXPECT_EQ(frontend_->view().geometry().zoom(), 1.0f);
    EXPECT_EQ(frontend_->view().geometry().grid().cols, 80);

    // The window cannot show more than its own cells.
    type(command('-'));
    EXPECT_EQ(frontend_->view().geometry().zoom(), 1.0f);

    for (int i = 0; i < 15; ++i) {
        type(command('='));
    }
    EXPECT_FLOAT_EQ(frontend_->view().geometry().zoom(), MAX_ZOOM);
    EXPECT_EQ(frontend_->view().geometry().grid().cols, 40);

    type(command('0'));
    EXPECT_EQ(frontend_->view().geometry().zoom(), 1.0f);
    EXPECT_EQ(frontend_->view().geometry().grid().rows, 24);
}

TEST(ConsoleFrontendConfigTest, ViewUsesConfiguredCellsAndZoom) {
    TempDir dir;
    StationConfig config = sh_config();
    config.cell_width = 10.0f;
    config.cell_height = 20.0f;
    config.zoom = 1.5f;
    SessionRegistry registry(config);
    DisplayNameStore names(dir.file("terminal_names.json"));

    int null_fd = ::open("/dev/null", O_RDWR);
    ASSERT_GE(null_fd, 0);
    {
        ConsoleFrontend frontend(registry, names, null_fd, null_fd);
        EXPECT_FLOAT_EQ(frontend.view().geometry().metrics().width, 10.0f);
        EXPECT_FLOAT_EQ(frontend.view().geometry().metrics().height, 20.0f);
        EXPECT_FLOAT_EQ(frontend.view().geometry().zoom(), 1.5f);

        GridSize grid = frontend.view().set_surface(1200.0f, 600.0f);
        EXPECT_EQ(grid.cols, 80);
        EXPECT_EQ(grid.rows, 20);
    }
    registry.shutdown();
    ::close(null_fd);
}

TEST(ConsoleFrontendConfigTest, ZoomBelowOneIsRaisedForTheConsole) {
    StationConfig config = sh_config();
    config.zoom = 0.5f;
    SessionRegistry registry(config);
    TempDir dir;
    DisplayNameStore names(dir.file("terminal_names.json"));

    ConsoleFrontend frontend(registry, names, -1, -1);
    EXPECT_EQ(frontend.view().geometry().zoom(), 1.0f);
}

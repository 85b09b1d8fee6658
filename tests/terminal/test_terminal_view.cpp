#include <gtest/gtest.h>
#include "terminal/terminal_view.h"
#include "process/session_registry.h"
#include "test_support.h"
#include <thread>

extern "C" {
#include <vterm.h>
}

using namespace station;
using station::testing_support::TempDir;
using station::testing_support::sh_config;
using station::testing_support::wait_until;

namespace {

bool screen_contains(VTerminal* term, const std::string& needle) {
    if (!term) return false;
    for (const auto& line : term->screen_text()) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

}

class TerminalViewTest : public ::testing::Test {
protected:
    void TearDown() override {
        view_.hide();
        registry_.shutdown();
    }

    SessionId create() {
        auto result = registry_.create("p-view", dir_.path());
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.value() : SessionId{};
    }

    bool pump_until(const std::function<bool()>& condition) {
        return wait_until([&] {
            view_.process_events();
            return condition();
        });
    }

    TempDir dir_;
    SessionRegistry registry_{sh_config()};
    TerminalView view_{registry_, CellMetrics{8.0f, 16.0f}};
};

TEST_F(TerminalViewTest, ShowUnknownSessionFails) {
    Status status = view_.show("t-missing-1");
    EXPECT_EQ(status.code, ErrorCode::UnknownSession);
    EXPECT_TRUE(view_.current().empty());
    EXPECT_FALSE(view_.attached());
}

TEST_F(TerminalViewTest, OutputAppliedOnlyWhenDrained) {
    SessionId id = create();
    ASSERT_TRUE(view_.show(id).ok());
    EXPECT_EQ(view_.current(), id);
    EXPECT_TRUE(view_.attached());

    ASSERT_TRUE(view_.send_input("printf 'mark%s\\n' er\n").ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_FALSE(screen_contains(view_.terminal(id), "marker"));

    EXPECT_TRUE(pump_until([&] { return screen_contains(view_.terminal(id), "marker"); }));

    bool found = false;
    for (const auto& line : view_.screen_lines()) {
        found = found || line == "marker";
    }
    EXPECT_TRUE(found);
}

TEST_F(TerminalViewTest, OutputListenerSeesTaggedChunks) {
    SessionId id = create();
    std::string seen;
    view_.set_output_listener([&](const OutputEvent& e) {
        EXPECT_EQ(e.session_id, id);
        seen += e.data;
    });
    ASSERT_TRUE(view_.show(id).ok());
    ASSERT_TRUE(view_.send_input("printf 'tag%s\\n' ged\n").ok());

    EXPECT_TRUE(pump_until([&] { return seen.find("tagged") != std::string::npos; }));
}

TEST_F(TerminalViewTest, EmulatorSurvivesSwitching) {
    SessionId a = create();
    SessionId b = create();

    ASSERT_TRUE(view_.show(a).ok());
    ASSERT_TRUE(view_.send_input("printf 'from%s\\n' -a\n").ok());
    ASSERT_TRUE(pump_until([&] { return screen_contains(view_.terminal(a), "from-a"); }));

    ASSERT_TRUE(view_.show(b).ok());
    EXPECT_EQ(view_.current(), b);
    ASSERT_TRUE(view_.send_input("printf 'from%s\\n' -b\n").ok());
    ASSERT_TRUE(pump_until([&] { return screen_contains(view_.terminal(b), "from-b"); }));
    EXPECT_FALSE(screen_contains(view_.terminal(a), "from-b"));

    ASSERT_TRUE(view_.show(a).ok());
    EXPECT_TRUE(screen_contains(view_.terminal(a), "from-a"));

    // The hidden session kept running.
    auto descriptor = registry_.descriptor(b);
    ASSERT_TRUE(descriptor.ok());
    EXPECT_TRUE(descriptor.value().is_running);
}

TEST_F(TerminalViewTest, SendKeyUsesKeyboardEncoder) {
    SessionId id = create();
    ASSERT_TRUE(view_.show(id).ok());

    ASSERT_TRUE(view_.send_input("printf 'k%s\\n' ey").ok());
    ASSERT_TRUE(view_.send_key(VTERM_KEY_ENTER).ok());
    EXPECT_TRUE(pump_until([&] { return screen_contains(view_.terminal(id), "key"); }));
}

TEST_F(TerminalViewTest, ExitShowsBannerAndNotifies) {
    SessionId id = create();
    ASSERT_TRUE(view_.show(id).ok());

    int exits = 0;
    view_.set_exit_listener([&](const ExitEvent& e) {
        EXPECT_EQ(e.session_id, id);
        EXPECT_EQ(e.exit_code, 4);
        ++exits;
    });

    ASSERT_TRUE(view_.send_input("exit 4\n").ok());
    EXPECT_TRUE(pump_until([&] { return exits == 1; }));
    EXPECT_TRUE(screen_contains(view_.terminal(id), "[Process exited]"));
    EXPECT_FALSE(view_.attached());

    // Writes to the dead session fail quietly.
    EXPECT_FALSE(view_.send_input("ls\n").ok());
}

TEST_F(TerminalViewTest, SurfaceResizesEmulatorAndPty) {
    SessionId id = create();
    ASSERT_TRUE(view_.show(id).ok());

    GridSize grid = view_.set_surface(960.0f, 640.0f);
    EXPECT_EQ(grid.cols, 120);
    EXPECT_EQ(grid.rows, 40);

    VTerminal* term = view_.terminal(id);
    ASSERT_NE(term, nullptr);
    EXPECT_EQ(term->cols(), 120);
    EXPECT_EQ(term->rows(), 40);

    auto session = registry_.find(id);
    ASSERT_NE(session, nullptr);
    int cols = 0;
    int rows = 0;
    ASSERT_TRUE(session->device_size(cols, rows));
    EXPECT_EQ(cols, 120);
    EXPECT_EQ(rows, 40);

    view_.set_zoom(2.0f);
    EXPECT_EQ(term->cols(), 60);
    ASSERT_TRUE(session->device_size(cols, rows));
    EXPECT_EQ(cols, 60);
    EXPECT_EQ(rows, 20);
}

TEST_F(TerminalViewTest, ForgetDropsEmulator) {
    SessionId id = create();
    ASSERT_TRUE(view_.show(id).ok());
    ASSERT_NE(view_.terminal(id), nullptr);

    view_.forget(id);
    EXPECT_EQ(view_.terminal(id), nullptr);
    EXPECT_TRUE(view_.current().empty());

    auto descriptor = registry_.descriptor(id);
    ASSERT_TRUE(descriptor.ok());
    EXPECT_TRUE(descriptor.value().is_running);
}

TEST_F(TerminalViewTest, QueuedOutputForForgottenSessionIsDropped) {
    SessionId id = create();
    ASSERT_TRUE(view_.show(id).ok());

    std::vector<std::string> delivered;
    view_.set_output_listener([&](const OutputEvent& event) { delivered.push_back(event.session_id); });

    ASSERT_TRUE(view_.send_input("printf 'late%s\\n' -chunk\n").ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    view_.forget(id);
    EXPECT_GT(view_.process_events(), 0u);
    EXPECT_EQ(view_.terminal(id), nullptr);
    EXPECT_TRUE(delivered.empty());
}

#include "../app/ReducerTestHelper.hpp"

#include <t9s/input/Keymap.hpp>
#include <t9s/nav/Location.hpp>
#include <t9s/ui/Frame.hpp>

#include <doctest/doctest.h>

using namespace T9;
using namespace T9::Testing;

namespace {

auto render(ReducerHarness const& h, int width = 100, int height = 20) -> UI::Frame {
    return UI::BuildFrame(h.state, h.registry, DefaultKeymap(), width, height);
}

auto contains(std::string const& text, std::string_view needle) -> bool {
    return text.find(needle) != std::string::npos;
}

auto hasStyle(UI::Line const& line, UI::Style style) -> bool {
    for (auto const& span : line.spans) {
        if (span.style == style) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST_SUITE("ui.frame") {
    TEST_CASE("Text fitting counts code points") {
        CHECK(UI::DisplayWidth("h\xC3\xA9llo") == 5);
        CHECK(UI::FitText("ab", 4) == "ab  ");
        CHECK(UI::FitText("abcdef", 4) == "abc~");
        CHECK(UI::FitText("\xC3\xA9\xC3\xA9\xC3\xA9", 2) == "\xC3\xA9~");
        CHECK(UI::FitText("abc", 0).empty());
    }

    TEST_CASE("An empty terminal yields an empty frame") {
        ReducerHarness h;
        auto           frame = render(h, 0, 10);
        CHECK(frame.lines.empty());
        CHECK_FALSE(frame.cursor.has_value());
    }

    TEST_CASE("Collection view lays out header, table and status") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(3), std::string{"3"});

        auto frame = render(h);
        REQUIRE(frame.lines.size() == 20);
        for (auto const& line : frame.lines) {
            CHECK(UI::DisplayWidth(line.text()) <= 100);
        }
        CHECK(contains(frame.lines[0].text(), " t9s "));
        CHECK(contains(frame.lines[0].text(), "Workflows"));
        CHECK(contains(frame.lines[0].text(), "ns:default  connected"));
        CHECK(contains(frame.lines[1].text(), "Workflows"));
        CHECK(contains(frame.lines[2].text(), "WORKFLOW ID"));
        CHECK(contains(frame.lines[3].text(), "wf-0"));
        CHECK(hasStyle(frame.lines[3], UI::Style::Selected));
        CHECK_FALSE(hasStyle(frame.lines[4], UI::Style::Selected));
        CHECK(contains(frame.lines[6].text(), "1/3 (more)"));
        CHECK(contains(frame.lines.back().text(), "polling 3s"));
        CHECK_FALSE(frame.cursor.has_value());
    }

    TEST_CASE("Selection moves the highlighted row") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(3));
        h.key(KeyCommand::MoveDown);

        auto frame = render(h);
        CHECK_FALSE(hasStyle(frame.lines[3], UI::Style::Selected));
        CHECK(hasStyle(frame.lines[4], UI::Style::Selected));
        CHECK(contains(frame.lines[6].text(), "2/3"));
    }

    TEST_CASE("Loading and empty collections show placeholders") {
        ReducerHarness h;
        h.dispatch(Navigate{MakeCollectionLocation("default", KindId::Schedule)});
        CHECK(contains(render(h).text(), "Loading..."));

        h.loadCollection(MakeCollectionLocation("default", KindId::Schedule), std::vector<Schedule>{});
        auto text = render(h).text();
        CHECK(contains(text, "No schedules found"));
        CHECK_FALSE(contains(text, "Loading..."));
    }

    TEST_CASE("Command input puts the cursor on the status line") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(2));
        h.key(KeyCommand::OpenCommandInput);
        h.dispatch(TextEdited{"sch"});

        auto frame = render(h, 80, 12);
        auto status = frame.lines.back().text();
        CHECK(status.starts_with(":sch"));
        CHECK(contains(status, "schedules"));
        REQUIRE(frame.cursor.has_value());
        CHECK(frame.cursor->row == 11);
        CHECK(frame.cursor->column == 4);
    }

    TEST_CASE("Confirmation draws a box over the body") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(2));
        h.dispatch(InvokeOperation{KindId::WorkflowExecution, OperationId::CancelWorkflow, std::nullopt});
        REQUIRE(std::holds_alternative<ConfirmOverlay>(h.state.overlay));

        auto frame = render(h);
        CHECK(frame.lines.size() == 20);
        CHECK(contains(frame.text(), "Confirm"));
        CHECK(contains(frame.text(), "Cancel workflow wf-0?"));
        CHECK(contains(frame.text(), "[y]"));
    }

    TEST_CASE("Help lists the bindings of the view underneath") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(2));
        h.key(KeyCommand::ToggleHelp);

        auto text = render(h, 120, 80).text();
        CHECK(contains(text, "Help"));
        CHECK(contains(text, "Move down"));
        CHECK(contains(text, "Cancel workflow"));
        CHECK(contains(text, "Quit"));
    }

    TEST_CASE("Toasts replace the key hints") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(1));
        h.state.toast = Toast{"Could not load workflows: boom", true, 1};

        auto frame = render(h);
        CHECK(contains(frame.lines.back().text(), "Could not load workflows: boom"));
        CHECK(hasStyle(frame.lines.back(), UI::Style::Error));
        CHECK_FALSE(contains(frame.lines.back().text(), "palette"));
    }

    TEST_CASE("Status shows the backed-off polling interval") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(1));
        h.state.error_count = 1;
        CHECK(contains(render(h).lines.back().text(), "polling 6s (1 errors)"));

        h.state.error_count = 9;
        CHECK(contains(render(h).lines.back().text(), "polling 60s (9 errors)"));
    }

    TEST_CASE("Workflow lists show their total") {
        ReducerHarness h;
        h.loadCollection(MakeCollectionLocation("default", KindId::WorkflowExecution), MakeWorkflows(2));
        CHECK_FALSE(contains(render(h).lines.back().text(), "workflows]"));

        REQUIRE(h.state.workflow_count.requested.has_value());
        h.dispatch(DataLoaded{LoadWorkflowCount{*h.state.workflow_count.requested}, WorkflowCount{1234}});
        CHECK(contains(render(h).lines.back().text(), "[1234 workflows]  polling 3s"));

        h.dispatch(Navigate{MakeCollectionLocation("default", KindId::Schedule)});
        CHECK_FALSE(contains(render(h).lines.back().text(), "workflows]"));
    }

    TEST_CASE("Detail view shows tabs and the loading state") {
        ReducerHarness h;
        h.dispatch(Navigate{MakeDetailLocation("default", WorkflowIdentity{"order-1", std::nullopt})});

        auto text = render(h).text();
        CHECK(contains(text, " Summary "));
        CHECK(contains(text, " History "));
        CHECK(contains(text, "Loading..."));
    }
}

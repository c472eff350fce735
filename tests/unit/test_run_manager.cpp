#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/workflow_plan.hpp"
#include "session/run_manager.hpp"

namespace {

using maestro::core::errors::get_error;
using maestro::core::errors::get_value;
using maestro::core::errors::is_error;
using maestro::runtime::WorkflowPlan;
using maestro::session::RunManager;
using maestro::session::RunState;

std::shared_ptr<const WorkflowPlan> make_plan() {
    auto plan = std::make_shared<WorkflowPlan>();
    plan->definition.name = "run-manager-demo";
    return plan;
}

std::string start(RunManager& manager) {
    auto started = manager.start_run(make_plan());
    EXPECT_FALSE(is_error(started));
    return is_error(started) ? "" : get_value(started);
}

TEST(RunManagerTest, StartRunCreatesRunAndRunningFollows) {
    RunManager manager;
    const std::string run_id = start(manager);
    EXPECT_EQ(run_id.rfind("wf-", 0), 0u);

    auto state = manager.get_run_state(run_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RunState::Created);

    auto running = manager.mark_running(run_id);
    ASSERT_FALSE(is_error(running));
    EXPECT_EQ(get_value(running), RunState::Running);

    auto again = manager.mark_running(run_id);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
}

TEST(RunManagerTest, CancelRunMovesToCancelled) {
    RunManager manager;
    const std::string run_id = start(manager);
    ASSERT_FALSE(is_error(manager.mark_running(run_id)));

    auto cancel = manager.cancel_run(run_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), RunState::Cancelled);

    auto state = manager.get_run_state(run_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RunState::Cancelled);
}

TEST(RunManagerTest, CancelRunSetsCancellationToken) {
    RunManager manager;
    const std::string run_id = start(manager);

    auto token_result = manager.get_cancel_token(run_id);
    ASSERT_FALSE(is_error(token_result));
    auto token = get_value(token_result);
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    auto cancel = manager.cancel_run(run_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_TRUE(token->load());
}

TEST(RunManagerTest, UnknownRunIsReported) {
    RunManager manager;
    auto cancel = manager.cancel_run("run-does-not-exist");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "run_not_found");

    auto token = manager.get_cancel_token("run-does-not-exist");
    ASSERT_TRUE(is_error(token));
    EXPECT_EQ(get_error(token).code, "run_not_found");

    auto plan = manager.get_plan("run-does-not-exist");
    ASSERT_TRUE(is_error(plan));
    EXPECT_EQ(get_error(plan).code, "run_not_found");
}

TEST(RunManagerTest, TerminalStatesAreFinal) {
    RunManager manager;
    const std::string run_id = start(manager);
    ASSERT_FALSE(is_error(manager.mark_running(run_id)));

    auto complete = manager.mark_completed(run_id);
    ASSERT_FALSE(is_error(complete));
    EXPECT_EQ(get_value(complete), RunState::Completed);

    auto cancel = manager.cancel_run(run_id);
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");

    auto fail = manager.mark_failed(run_id, "late failure");
    ASSERT_TRUE(is_error(fail));
    EXPECT_EQ(get_error(fail).code, "invalid_state_transition");
}

TEST(RunManagerTest, StartRunRejectsMissingPlan) {
    RunManager manager;
    auto start = manager.start_run(nullptr);
    ASSERT_TRUE(is_error(start));
    EXPECT_EQ(get_error(start).code, "invalid_run_request");
    EXPECT_EQ(manager.run_count(), 0u);
}

TEST(RunManagerTest, KeepsPlanForRun) {
    RunManager manager;
    const std::string run_id = start(manager);
    auto plan = manager.get_plan(run_id);
    ASSERT_FALSE(is_error(plan));
    EXPECT_EQ(get_value(plan)->definition.name, "run-manager-demo");
    EXPECT_EQ(RunManager::to_string(RunState::Created), "created");
}

TEST(RunManagerTest, RetentionDropsOldestFinishedRunsOnly) {
    RunManager manager(2);
    const std::string active = start(manager);
    ASSERT_FALSE(is_error(manager.mark_running(active)));

    std::vector<std::string> finished;
    for (int i = 0; i < 4; ++i) {
        const std::string run_id = start(manager);
        ASSERT_FALSE(is_error(manager.mark_running(run_id)));
        ASSERT_FALSE(is_error(manager.mark_completed(run_id)));
        finished.push_back(run_id);
    }

    EXPECT_EQ(manager.run_count(), 3u);
    EXPECT_EQ(get_error(manager.get_run_state(finished[0])).code, "run_not_found");
    EXPECT_EQ(get_error(manager.get_run_state(finished[1])).code, "run_not_found");
    EXPECT_FALSE(is_error(manager.get_run_state(finished[2])));
    EXPECT_FALSE(is_error(manager.get_run_state(finished[3])));

    auto still_running = manager.get_run_state(active);
    ASSERT_FALSE(is_error(still_running));
    EXPECT_EQ(get_value(still_running), RunState::Running);
}

TEST(RunManagerTest, ReleaseRunRequiresTerminalState) {
    RunManager manager;
    const std::string run_id = start(manager);

    auto early = manager.release_run(run_id);
    ASSERT_TRUE(is_error(early));
    EXPECT_EQ(get_error(early).code, "invalid_state_transition");

    ASSERT_FALSE(is_error(manager.cancel_run(run_id)));
    EXPECT_FALSE(is_error(manager.release_run(run_id)));
    EXPECT_EQ(manager.run_count(), 0u);

    auto missing = manager.release_run(run_id);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "run_not_found");
}

}  // namespace

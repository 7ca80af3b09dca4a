#include <gtest/gtest.h>
#include "phasegraph/common/errors.hpp"
#include "phasegraph/execution/channel.hpp"
#include "phasegraph/execution/null_operation_runner.hpp"
#include "phasegraph/execution/operation_task.hpp"
#include "phasegraph/graph/operation_graph.hpp"
#include <thread>

using namespace phasegraph;

class OperationTaskTests : public ::testing::Test
{
protected:
    static Operation make_operation(IndexSet dependencies)
    {
        Operation operation;
        operation.name = "app (_phase:build)";
        operation.dependencies = std::move(dependencies);
        return operation;
    }
};

// =============================================================================
// OperationTask state machine
// =============================================================================

TEST_F(OperationTaskTests, InitialState_IsReadyStatus)
{
    Operation with_deps = make_operation({0, 1});
    OperationTask waiting(with_deps, 2);
    EXPECT_EQ(waiting.status(), OperationStatus::Ready);
    EXPECT_FALSE(waiting.is_ready());

    Operation without_deps = make_operation({});
    OperationTask free(without_deps, 0);
    EXPECT_TRUE(free.is_ready());
    EXPECT_EQ(free.idx(), 0u);
}

TEST_F(OperationTaskTests, DecrementRemainingDependencies_BecomesReadyOnLast)
{
    Operation operation = make_operation({0, 1});
    OperationTask task(operation, 2);

    EXPECT_FALSE(task.decrement_remaining_dependencies());
    EXPECT_TRUE(task.decrement_remaining_dependencies());
    EXPECT_TRUE(task.is_ready());
    EXPECT_THROW(task.decrement_remaining_dependencies(), GraphConsistencyError);
}

TEST_F(OperationTaskTests, FullLifecycle_RecordsDuration)
{
    Operation operation = make_operation({});
    OperationTask task(operation, 0);

    task.mark_queued();
    EXPECT_EQ(task.status(), OperationStatus::Queued);
    task.mark_executing();
    EXPECT_EQ(task.status(), OperationStatus::Executing);
    task.complete(OperationStatus::FromCache, std::chrono::nanoseconds{42});
    EXPECT_EQ(task.status(), OperationStatus::FromCache);
    EXPECT_EQ(task.duration().count(), 42);
}

TEST_F(OperationTaskTests, IllegalTransitions_Throw)
{
    Operation operation = make_operation({0});
    OperationTask task(operation, 1);

    // Dependencies not finished yet.
    EXPECT_THROW(task.mark_queued(), GraphConsistencyError);
    EXPECT_THROW(task.mark_executing(), GraphConsistencyError);
    EXPECT_THROW(task.complete(OperationStatus::Success, {}), GraphConsistencyError);

    task.mark_blocked();
    EXPECT_EQ(task.status(), OperationStatus::Blocked);

    // Terminal states are final.
    EXPECT_THROW(task.mark_blocked(), GraphConsistencyError);
}

TEST_F(OperationTaskTests, Complete_WithNonTerminalStatus_Throws)
{
    Operation operation = make_operation({});
    OperationTask task(operation, 0);
    task.mark_queued();
    task.mark_executing();
    EXPECT_THROW(task.complete(OperationStatus::Queued, {}), GraphConsistencyError);
}

// =============================================================================
// OperationStatus helpers
// =============================================================================

TEST_F(OperationTaskTests, StatusClassification)
{
    EXPECT_FALSE(is_terminal(OperationStatus::Ready));
    EXPECT_FALSE(is_terminal(OperationStatus::Executing));
    EXPECT_TRUE(is_terminal(OperationStatus::Blocked));

    EXPECT_TRUE(blocks_consumers(OperationStatus::Failure));
    EXPECT_TRUE(blocks_consumers(OperationStatus::Blocked));
    EXPECT_FALSE(blocks_consumers(OperationStatus::SuccessWithWarning));

    for (OperationStatus status : {OperationStatus::Success,
                                   OperationStatus::SuccessWithWarning,
                                   OperationStatus::Skipped,
                                   OperationStatus::NoOp,
                                   OperationStatus::FromCache})
    {
        EXPECT_TRUE(satisfies_consumers(status)) << to_string(status);
    }
    EXPECT_STREQ(to_string(OperationStatus::NoOp), "NO OP");
}

// =============================================================================
// NullOperationRunner
// =============================================================================

TEST_F(OperationTaskTests, NullOperationRunner_ReturnsConfiguredStatus)
{
    NullOperationRunner runner("lib (_phase:lint)", OperationStatus::NoOp, true);
    Operation operation = make_operation({});
    OperationRunnerContext context{operation, CancellationToken{}, make_null_logger()};

    EXPECT_EQ(runner.execute(context).status, OperationStatus::NoOp);
    EXPECT_TRUE(runner.silent());
    EXPECT_EQ(runner.name(), "lib (_phase:lint)");
}

TEST_F(OperationTaskTests, NullOperationRunner_RejectsBlockedAndNonTerminal)
{
    EXPECT_THROW(NullOperationRunner("x", OperationStatus::Blocked, false), std::invalid_argument);
    EXPECT_THROW(NullOperationRunner("x", OperationStatus::Ready, false), std::invalid_argument);
}

// =============================================================================
// Channel
// =============================================================================

TEST_F(OperationTaskTests, Channel_DeliversInOrderAndDrainsAfterClose)
{
    Channel<int> channel;
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    channel.close();
    EXPECT_FALSE(channel.push(3));

    EXPECT_EQ(channel.pop(), 1);
    EXPECT_EQ(channel.pop(), 2);
    EXPECT_FALSE(channel.pop().has_value());
    EXPECT_TRUE(channel.closed());
}

TEST_F(OperationTaskTests, Channel_PopUntil_TimesOut)
{
    Channel<int> channel;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(10);
    EXPECT_FALSE(channel.pop_until(deadline).has_value());
}

TEST_F(OperationTaskTests, Channel_PopBlocksUntilPush)
{
    Channel<int> channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        channel.push(7);
    });
    EXPECT_EQ(channel.pop(), 7);
    producer.join();
}

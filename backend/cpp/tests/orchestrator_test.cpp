#include "orchestrator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

class OrchestratorTest : public ::testing::Test {
protected:
    void TearDown() override {
        held_->releaseAll();
        orchestrator_.reset();
    }

    Orchestrator& make(OrchestratorConfig config, std::shared_ptr<Dispatcher> dispatcher) {
        orchestrator_ = std::make_unique<Orchestrator>(std::move(config), std::move(dispatcher), clock_, random_);
        recorder_.attach(orchestrator_->events());
        return *orchestrator_;
    }

    Orchestrator& makeHeld(OrchestratorConfig config = testConfig()) { return make(std::move(config), held_); }

    std::vector<std::string> assignedOrder() const {
        std::vector<std::string> ids;
        for (const auto& event : recorder_.events()) {
            if (event.type == EventType::TaskAssigned) {
                ids.push_back(event.task->id);
            }
        }
        return ids;
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    std::shared_ptr<ScriptedRandom> random_ = std::make_shared<ScriptedRandom>();
    std::shared_ptr<HeldDispatcher> held_ = std::make_shared<HeldDispatcher>();
    EventRecorder recorder_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

TEST_F(OrchestratorTest, MatchedTaskRunsToCompletion) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.registerAgent(makeAgent("quantum-a", CapabilityType::Quantum, 8.0));

    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Quantum, 5));
    Task task = orchestrator.getTask(id);
    EXPECT_EQ(task.status, TaskStatus::Processing);
    EXPECT_EQ(task.assigned_agents, (std::vector<std::string>{"quantum-a"}));
    EXPECT_EQ(orchestrator.getAgent("quantum-a").status, AgentStatus::Busy);
    EXPECT_TRUE(orchestrator.getTaskQueue().empty());

    clock_->advance(1500ms);
    ASSERT_TRUE(held_->release(id, DispatchResult{true, 1500.0}));
    ASSERT_TRUE(recorder_.waitFor(EventType::TaskCompleted, 1));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));

    task = orchestrator.getTask(id);
    EXPECT_EQ(task.status, TaskStatus::Completed);
    ASSERT_TRUE(task.actual_duration.has_value());
    EXPECT_DOUBLE_EQ(*task.actual_duration, 1500.0);

    const Agent agent = orchestrator.getAgent("quantum-a");
    EXPECT_EQ(agent.status, AgentStatus::Idle);
    EXPECT_TRUE(agent.current_tasks.empty());
    EXPECT_EQ(agent.performance.tasks_completed, 1);
    EXPECT_EQ(agent.performance.last_active, clock_->now());

    EXPECT_EQ(recorder_.names(),
              (std::vector<std::string>{"task_submitted", "task_assigned", "task_started", "task_completed"}));
    const OrchestrationMetrics metrics = orchestrator.getMetrics();
    EXPECT_EQ(metrics.completed_tasks, 1u);
    EXPECT_DOUBLE_EQ(metrics.average_task_time, 1500.0);
    EXPECT_DOUBLE_EQ(metrics.network_efficiency, 1.0);
}

TEST_F(OrchestratorTest, UnmatchedTaskTriggersScalingUnderLoad) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.registerAgent(makeAgent("quantum-a", CapabilityType::Quantum, 5.0, 1));
    orchestrator.submitTask(makeSpec(CapabilityType::Quantum, 3));
    ASSERT_DOUBLE_EQ(orchestrator.getMetrics().system_load, 1.0);

    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Quantum, 9));

    EXPECT_EQ(orchestrator.getTask(id).status, TaskStatus::Pending);
    const auto queue = orchestrator.getTaskQueue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.front().id, id);

    ASSERT_EQ(orchestrator.getAgents().size(), 2u);
    const Agent spawned = orchestrator.getAgent("quantum-001");
    EXPECT_EQ(spawned.capabilities.front().type, CapabilityType::Quantum);
    EXPECT_EQ(spawned.status, AgentStatus::Idle);
    EXPECT_EQ(recorder_.count(EventType::AgentSpawned), 1u);
}

TEST_F(OrchestratorTest, UnmatchedTaskWithoutLoadDoesNotScale) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.registerAgent(makeAgent("quantum-a", CapabilityType::Quantum, 5.0));

    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Quantum, 9));
    EXPECT_EQ(orchestrator.getTask(id).status, TaskStatus::Pending);
    EXPECT_EQ(orchestrator.getAgents().size(), 1u);
    EXPECT_EQ(recorder_.count(EventType::AgentSpawned), 0u);
}

TEST_F(OrchestratorTest, FailedCriticalTaskJumpsTheQueue) {
    OrchestratorConfig config = testConfig();
    config.max_pool_size = 1;
    Orchestrator& orchestrator = makeHeld(config);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 5.0, 1));

    const std::string critical = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 5, TaskPriority::Critical));
    const std::string waiting = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 5, TaskPriority::Medium));
    ASSERT_EQ(orchestrator.getTask(waiting).status, TaskStatus::Pending);

    ASSERT_TRUE(held_->release(critical, DispatchResult{false, 800.0}));
    ASSERT_TRUE(recorder_.waitFor(EventType::TaskFailed, 1));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));

    const Task task = orchestrator.getTask(critical);
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_TRUE(task.assigned_agents.empty());
    EXPECT_EQ(task.attempts, 1);

    const auto queue = orchestrator.getTaskQueue();
    ASSERT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue[0].id, critical);
    EXPECT_EQ(queue[1].id, waiting);

    // The failure cost the agent the level it needed
    EXPECT_NEAR(orchestrator.getAgent("nlp-a").capabilities.front().level, 4.995, 1e-12);

    for (const auto& event : recorder_.events()) {
        if (event.type == EventType::TaskFailed) {
            EXPECT_EQ(event.task->status, TaskStatus::Failed);
            EXPECT_EQ(event.task->assigned_agents, (std::vector<std::string>{"nlp-a"}));
        }
    }
    EXPECT_EQ(orchestrator.getMetrics().failed_tasks, 0u);
}

TEST_F(OrchestratorTest, CriticalRetriesAreBounded) {
    OrchestratorConfig config = testConfig();
    config.max_critical_retries = 2;
    auto failing = std::make_shared<ScriptedDispatcher>(DispatchResult{false, 500.0});
    Orchestrator& orchestrator = make(config, failing);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 10.0));

    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3, TaskPriority::Critical));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));

    const Task task = orchestrator.getTask(id);
    EXPECT_EQ(task.status, TaskStatus::Failed);
    EXPECT_EQ(task.attempts, 3);
    EXPECT_EQ(failing->dispatched().size(), 3u);
    EXPECT_EQ(recorder_.count(EventType::TaskStarted), 3u);
    EXPECT_EQ(recorder_.count(EventType::TaskFailed), 3u);
    EXPECT_TRUE(orchestrator.getTaskQueue().empty());

    const OrchestrationMetrics metrics = orchestrator.getMetrics();
    EXPECT_EQ(metrics.failed_tasks, 1u);
    EXPECT_EQ(metrics.retried_tasks, 2u);
    EXPECT_TRUE(orchestrator.getAgent("nlp-a").current_tasks.empty());
}

TEST_F(OrchestratorTest, NonCriticalFailureIsTerminal) {
    auto failing = std::make_shared<ScriptedDispatcher>(DispatchResult{false, 700.0});
    Orchestrator& orchestrator = make(testConfig(), failing);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 8.0));

    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3, TaskPriority::High));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));

    const Task task = orchestrator.getTask(id);
    EXPECT_EQ(task.status, TaskStatus::Failed);
    EXPECT_EQ(task.attempts, 1);
    EXPECT_DOUBLE_EQ(task.actual_duration.value_or(0.0), 700.0);
    EXPECT_TRUE(orchestrator.getTaskQueue().empty());
    EXPECT_EQ(recorder_.count(EventType::TaskFailed), 1u);
    EXPECT_EQ(orchestrator.getAgent("nlp-a").performance.tasks_completed, 0);
}

TEST_F(OrchestratorTest, AgentsNeverExceedTheirCapacity) {
    OrchestratorConfig config = testConfig();
    config.max_pool_size = 2;
    Orchestrator& orchestrator = makeHeld(config);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0, 2));
    orchestrator.registerAgent(makeAgent("nlp-b", CapabilityType::Nlp, 9.0, 3));

    std::vector<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back(orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3)));
    }

    std::size_t bound = 0;
    for (const auto& agent : orchestrator.getAgents()) {
        EXPECT_LE(static_cast<int>(agent.current_tasks.size()), agent.maxConcurrentTasks());
        EXPECT_EQ(agent.status, AgentStatus::Overloaded);
        bound += agent.current_tasks.size();
    }
    EXPECT_EQ(bound, 5u);
    EXPECT_EQ(orchestrator.getTaskQueue().size(), 5u);
    EXPECT_EQ(orchestrator.getMetrics().agent_utilization, 1.0);

    held_->releaseAll();
    ASSERT_TRUE(orchestrator.waitForIdle(5s));

    for (const auto& id : ids) {
        const Task task = orchestrator.getTask(id);
        EXPECT_EQ(task.status, TaskStatus::Completed);
        EXPECT_EQ(task.assigned_agents.size(), 1u);
    }
    for (const auto& agent : orchestrator.getAgents()) {
        EXPECT_TRUE(agent.current_tasks.empty());
        EXPECT_EQ(agent.status, AgentStatus::Idle);
    }
    EXPECT_EQ(orchestrator.getMetrics().completed_tasks, 10u);
    EXPECT_EQ(orchestrator.getMetrics().queue_length, 0u);
}

TEST_F(OrchestratorTest, FreedCapacityGoesToHighestPriority) {
    OrchestratorConfig config = testConfig();
    config.max_pool_size = 1;
    Orchestrator& orchestrator = makeHeld(config);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0, 1));

    const std::string blocker = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3));
    const std::string low = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3, TaskPriority::Low));
    const std::string high = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3, TaskPriority::High));
    const std::string critical = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3, TaskPriority::Critical));
    const std::string medium = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3, TaskPriority::Medium));

    held_->releaseAll();
    ASSERT_TRUE(orchestrator.waitForIdle(5s));

    EXPECT_EQ(assignedOrder(), (std::vector<std::string>{blocker, critical, high, medium, low}));
    EXPECT_EQ(orchestrator.getMetrics().completed_tasks, 5u);
}

TEST_F(OrchestratorTest, MetricsAreStableAndMonotonic) {
    auto scripted = std::make_shared<ScriptedDispatcher>();
    scripted->push({true, 1000.0});
    scripted->push({false, 2000.0});
    scripted->push({true, 3000.0});
    Orchestrator& orchestrator = make(testConfig(), scripted);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0));

    OrchestrationMetrics previous = orchestrator.getMetrics();
    for (int i = 0; i < 3; ++i) {
        orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3));
        ASSERT_TRUE(orchestrator.waitForIdle(2s));

        const OrchestrationMetrics current = orchestrator.getMetrics();
        EXPECT_EQ(current, orchestrator.getMetrics());
        EXPECT_EQ(current.total_tasks, previous.total_tasks + 1);
        EXPECT_GE(current.completed_tasks, previous.completed_tasks);
        EXPECT_GE(current.failed_tasks, previous.failed_tasks);
        previous = current;
    }

    EXPECT_EQ(previous.completed_tasks, 2u);
    EXPECT_EQ(previous.failed_tasks, 1u);
    EXPECT_DOUBLE_EQ(previous.average_task_time, 2000.0);
    EXPECT_DOUBLE_EQ(previous.network_efficiency, 2.0 / 3.0);
}

TEST_F(OrchestratorTest, BusyAgentCannotBeRemoved) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0));
    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3));

    EXPECT_THROW(orchestrator.removeAgent("nlp-a"), std::runtime_error);
    ASSERT_EQ(orchestrator.getAgents().size(), 1u);
    EXPECT_EQ(orchestrator.getAgent("nlp-a").current_tasks.count(id), 1u);

    ASSERT_TRUE(held_->release(id, DispatchResult{true, 900.0}));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));
    orchestrator.removeAgent("nlp-a");
    EXPECT_TRUE(orchestrator.getAgents().empty());
    EXPECT_THROW(orchestrator.removeAgent("nlp-a"), std::runtime_error);
}

TEST_F(OrchestratorTest, TickPublishesMetrics) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.submitTask(makeSpec(CapabilityType::Swarm, 4));

    orchestrator.tick();

    ASSERT_EQ(recorder_.count(EventType::MetricsUpdated), 1u);
    const auto events = recorder_.events();
    const OrchestratorEvent& updated = events.back();
    EXPECT_EQ(updated.type, EventType::MetricsUpdated);
    ASSERT_TRUE(updated.metrics.has_value());
    EXPECT_EQ(updated.metrics->total_tasks, 1u);
    EXPECT_EQ(updated.metrics->queue_length, 1u);
    EXPECT_EQ(*updated.metrics, orchestrator.getMetrics());
}

TEST_F(OrchestratorTest, NewOrReturningAgentsPickUpQueuedWork) {
    Orchestrator& orchestrator = makeHeld();
    const std::string first = orchestrator.submitTask(makeSpec(CapabilityType::Compliance, 4));
    EXPECT_EQ(orchestrator.getTask(first).status, TaskStatus::Pending);

    orchestrator.registerAgent(makeAgent("compliance-a", CapabilityType::Compliance, 9.0));
    EXPECT_EQ(orchestrator.getTask(first).status, TaskStatus::Processing);

    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0));
    orchestrator.setAgentStatus("nlp-a", AgentStatus::Maintenance);
    const std::string second = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 4));
    EXPECT_EQ(orchestrator.getTask(second).status, TaskStatus::Pending);
    EXPECT_EQ(orchestrator.getAgent("nlp-a").status, AgentStatus::Maintenance);

    orchestrator.setAgentStatus("nlp-a", AgentStatus::Idle);
    EXPECT_EQ(orchestrator.getTask(second).status, TaskStatus::Processing);
    EXPECT_EQ(orchestrator.getAgent("nlp-a").status, AgentStatus::Busy);
}

TEST_F(OrchestratorTest, SubscribersAreIsolatedAndMayCallBack) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0));
    orchestrator.subscribe("task_submitted",
                           [](const OrchestratorEvent&) { throw std::runtime_error("dashboard unavailable"); });
    TaskStatus seen = TaskStatus::Pending;
    orchestrator.subscribe(EventType::TaskAssigned, [&](const OrchestratorEvent& event) {
        seen = orchestrator.getTask(event.task->id).status;
    });

    std::string id;
    EXPECT_NO_THROW(id = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3)));
    EXPECT_EQ(seen, TaskStatus::Processing);
    EXPECT_EQ(orchestrator.getTask(id).status, TaskStatus::Processing);
}

TEST_F(OrchestratorTest, CompletionHandlerThrowingNonStandardValueLeavesOrchestratorUsable) {
    Orchestrator& orchestrator = makeHeld();
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0, 1));
    orchestrator.subscribe("task_completed", [](const OrchestratorEvent&) { throw 42; });

    const std::string first = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3));
    const std::string second = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 3));
    EXPECT_EQ(orchestrator.getTask(second).status, TaskStatus::Pending);

    ASSERT_TRUE(held_->release(first, DispatchResult{true, 100.0}));
    ASSERT_TRUE(recorder_.waitFor(EventType::TaskCompleted, 1));
    EXPECT_EQ(orchestrator.getTask(first).status, TaskStatus::Completed);

    // The freed agent picked up the queued task in the same completion pass
    ASSERT_TRUE(recorder_.waitFor(EventType::TaskStarted, 2));
    ASSERT_TRUE(held_->release(second, DispatchResult{true, 100.0}));
    ASSERT_TRUE(recorder_.waitFor(EventType::TaskCompleted, 2));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));
    EXPECT_EQ(orchestrator.getTask(second).status, TaskStatus::Completed);
    EXPECT_EQ(orchestrator.getMetrics().completed_tasks, 2u);
}

TEST_F(OrchestratorTest, WatchdogFailsStuckExecutions) {
    OrchestratorConfig config = testConfig();
    config.execution_timeout_factor = 0.01;
    Orchestrator& orchestrator = makeHeld(config);
    orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0));

    const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 1));
    ASSERT_TRUE(recorder_.waitFor(EventType::TaskFailed, 1));
    ASSERT_TRUE(orchestrator.waitForIdle(2s));

    const Task task = orchestrator.getTask(id);
    EXPECT_EQ(task.status, TaskStatus::Failed);
    EXPECT_DOUBLE_EQ(task.actual_duration.value_or(0.0), 30.0);
    EXPECT_TRUE(orchestrator.getAgent("nlp-a").current_tasks.empty());
}

TEST_F(OrchestratorTest, StartRunsPeriodicTicksUntilStopped) {
    OrchestratorConfig config = testConfig();
    config.tick_interval_ms = 10;
    Orchestrator& orchestrator = makeHeld(config);

    orchestrator.start();
    orchestrator.start();
    ASSERT_TRUE(recorder_.waitFor(EventType::MetricsUpdated, 2));
    orchestrator.stop();

    const std::size_t ticks = recorder_.count(EventType::MetricsUpdated);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(recorder_.count(EventType::MetricsUpdated), ticks);
}

TEST_F(OrchestratorTest, SeedsDefaultRoster) {
    OrchestratorConfig config = testConfig();
    config.seed_default_agents = true;
    config.agents.push_back(makeAgent("analytics-001", CapabilityType::Analytics, 7.0));
    Orchestrator& orchestrator = makeHeld(config);

    std::vector<std::string> ids;
    for (const auto& agent : orchestrator.getAgents()) {
        ids.push_back(agent.id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"analytics-001", "compliance-001", "copilot-001", "nlp-001",
                                             "quantum-001", "swarm-001"}));
    EXPECT_EQ(orchestrator.getAgent("analytics-001").performance.last_active, clock_->now());
}

TEST_F(OrchestratorTest, RejectsInvalidInput) {
    Orchestrator& orchestrator = makeHeld();
    EXPECT_THROW(orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 11)), std::invalid_argument);
    EXPECT_THROW(orchestrator.submitTask(TaskSpec{}), std::invalid_argument);
    EXPECT_THROW(orchestrator.subscribe("task_lost", [](const OrchestratorEvent&) {}), std::invalid_argument);
    EXPECT_THROW(orchestrator.getTask("task_404"), std::runtime_error);
    EXPECT_THROW(orchestrator.getAgent("ghost"), std::runtime_error);
    EXPECT_THROW(orchestrator.setAgentStatus("ghost", AgentStatus::Offline), std::runtime_error);
    EXPECT_TRUE(orchestrator.getTasks().empty());
    EXPECT_EQ(recorder_.count(EventType::TaskSubmitted), 0u);
}

TEST(OrchestratorSimulationTest, SameSeedGivesSameOutcomes) {
    auto run = [] {
        OrchestratorConfig config = testConfig();
        config.rng_seed = 1234;
        Orchestrator orchestrator(config, nullptr, std::make_shared<ManualClock>());
        orchestrator.registerAgent(makeAgent("nlp-a", CapabilityType::Nlp, 9.0, 3, 0.5));
        orchestrator.registerAgent(makeAgent("nlp-b", CapabilityType::Nlp, 9.0, 3, 0.5));

        std::vector<std::pair<TaskStatus, double>> outcomes;
        for (int i = 0; i < 8; ++i) {
            const std::string id = orchestrator.submitTask(makeSpec(CapabilityType::Nlp, 2));
            EXPECT_TRUE(orchestrator.waitForIdle(2s));
            const Task task = orchestrator.getTask(id);
            outcomes.emplace_back(task.status, task.actual_duration.value_or(-1.0));
        }
        for (const auto& [status, duration] : outcomes) {
            EXPECT_TRUE(status == TaskStatus::Completed || status == TaskStatus::Failed);
            EXPECT_GE(duration, 2000.0);
            EXPECT_LT(duration, 4000.0);
        }
        return outcomes;
    };

    EXPECT_EQ(run(), run());
}

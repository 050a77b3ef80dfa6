#include <gtest/gtest.h>

#include "sim/Config.hpp"
#include "sim/Errors.hpp"
#include "sim/Simulation.hpp"

#include <sstream>
#include <vector>

TEST(SimulationTest, PhaseLifecycle) {
    Simulation sim(3, 1, PolicyKind::Naive);
    EXPECT_EQ(sim.phase(), SimulationPhase::Idle);
    EXPECT_EQ(sim.tick(), 0u);

    EXPECT_FALSE(sim.step().completed);
    EXPECT_EQ(sim.phase(), SimulationPhase::Running);

    EXPECT_TRUE(sim.step().completed);
    EXPECT_EQ(sim.phase(), SimulationPhase::Completed);
    EXPECT_EQ(sim.tick(), 2u);
}

TEST(SimulationTest, StepAfterCompletionIsNoOp) {
    Simulation sim(4, 2, PolicyKind::Smart);
    sim.runToCompletion();
    const auto ticks = sim.tick();
    const auto snapshot = sim.state();

    for (int i = 0; i < 3; ++i) {
        const auto result = sim.step();
        EXPECT_TRUE(result.completed);
        EXPECT_TRUE(result.transfers.empty());
        EXPECT_EQ(result.state, snapshot);
    }
    EXPECT_EQ(sim.tick(), ticks);
}

TEST(SimulationTest, MarkersDescribeOnlyTheLastTick) {
    Simulation sim(4, 2, PolicyKind::Smart);

    sim.step();
    sim.step();
    EXPECT_EQ(sim.state().transmittingCount(), 2);

    const auto result = sim.step();
    EXPECT_EQ(result.state.transmittingCount(), static_cast<int>(result.transfers.size()));
    for (const auto& node : result.state.nodes()) {
        if (!node.transmitting) {
            EXPECT_FALSE(node.transmittingTo.has_value());
        }
    }
    for (const auto& t : result.transfers)
        EXPECT_EQ(result.state.node(t.from).transmittingTo, t.to);
}

TEST(SimulationTest, PresenceIsMonotonic) {
    for (auto policy : {PolicyKind::Naive, PolicyKind::Smart}) {
        Simulation sim(12, 5, policy);
        auto previous = sim.state();
        while (!sim.completed()) {
            const auto& next = sim.step().state;
            EXPECT_GT(next.totalPresent(), previous.totalPresent());
            for (int n = 0; n < next.nodeCount(); ++n) {
                for (int c = 0; c < next.chunkCount(); ++c) {
                    if (previous.node(n).has(c)) EXPECT_TRUE(next.node(n).has(c));
                }
            }
            previous = next;
        }
        EXPECT_EQ(sim.state().totalPresent(), 12 * 5);
    }
}

TEST(SimulationTest, Deterministic) {
    for (auto policy : {PolicyKind::Naive, PolicyKind::Smart}) {
        Simulation a(20, 3, policy), b(20, 3, policy);
        while (!a.completed()) {
            const auto ra = a.step();
            const auto rb = b.step();
            EXPECT_EQ(ra.transfers, rb.transfers);
            EXPECT_EQ(ra.state, rb.state);
        }
        EXPECT_TRUE(b.completed());
        EXPECT_EQ(a.tick(), b.tick());
    }
}

TEST(SimulationTest, ResetStartsOver) {
    Simulation sim(5, 2, PolicyKind::Naive);
    sim.step();
    sim.step();

    sim.reset();
    EXPECT_EQ(sim.phase(), SimulationPhase::Idle);
    EXPECT_EQ(sim.tick(), 0u);
    EXPECT_EQ(sim.state(), NetworkState::create(5, 2));
    EXPECT_TRUE(sim.lastTransfers().empty());

    sim.reset(9);
    EXPECT_EQ(sim.state().nodeCount(), 9);
    EXPECT_EQ(sim.state().chunkCount(), 2);
    EXPECT_EQ(sim.policy(), PolicyKind::Naive);
    EXPECT_THROW(sim.reset(1), ConfigurationError);
}

TEST(SimulationTest, PolicySwitch) {
    Simulation sim(8, 1, PolicyKind::Naive);
    sim.setPolicy(PolicyKind::Smart);
    EXPECT_EQ(sim.policy(), PolicyKind::Smart);
    EXPECT_EQ(sim.runToCompletion(), 3u);
}

TEST(SimulationTest, StallIsReported) {
    auto nodes = NetworkState::create(3, 2).nodes();
    nodes[0].chunks[1].present = false; // nobody holds chunk 1

    Simulation sim(NetworkState(nodes), PolicyKind::Smart);
    EXPECT_THROW(sim.runToCompletion(), InvalidStateError);
    EXPECT_FALSE(sim.completed());
}

TEST(SimulationTest, RejectsMalformedInitialState) {
    auto nodes = NetworkState::create(3, 2).nodes();
    nodes[1].chunks.push_back(Chunk{ 2, false });
    EXPECT_THROW((Simulation{NetworkState(nodes), PolicyKind::Naive}), InvalidStateError);
}

TEST(SimulationTest, ConfigConstructor) {
    SimulationConfig config;
    config.nodeCount = 6;
    config.chunkCount = 2;
    config.policy = PolicyKind::Smart;

    Simulation sim(config);
    EXPECT_EQ(sim.state().nodeCount(), 6);
    EXPECT_EQ(sim.state().chunkCount(), 2);
    EXPECT_EQ(sim.policy(), PolicyKind::Smart);
}

TEST(SimulationTest, TraceOutput) {
    std::ostringstream out;
    Simulation sim(3, 1, PolicyKind::Naive);
    sim.setTrace(&out);
    sim.runToCompletion();

    EXPECT_EQ(out.str(),
              "[Simulation] tick 0: node 0 -> node 1 (chunk 0)\n"
              "[Simulation] tick 1: node 0 -> node 2 (chunk 0)\n"
              "[Simulation] naive propagation complete after 2 ticks\n");
}

TEST(StatelessStepTest, ThreadsStateThroughCalls) {
    auto state = initialize(3, 2);
    const std::vector<Transfer> expected = {{0, 1, 0}, {0, 2, 0}, {0, 1, 1}, {0, 2, 1}};

    std::uint64_t tick = 0;
    bool completed = false;
    while (!completed) {
        auto outcome = step(std::move(state), tick, PolicyKind::Naive);
        ASSERT_EQ(outcome.transfers.size(), 1u);
        EXPECT_EQ(outcome.transfers.front(), expected[tick]);
        state = std::move(outcome.state);
        completed = outcome.completed;
        ++tick;
    }
    EXPECT_EQ(tick, 4u);
    EXPECT_TRUE(isComplete(state));

    const auto again = step(state, tick, PolicyKind::Smart);
    EXPECT_TRUE(again.completed);
    EXPECT_TRUE(again.transfers.empty());
    EXPECT_EQ(again.state, state);
}

TEST(StatelessStepTest, ClearsPreviousMarkers) {
    auto state = initialize(4, 1);
    state.markTransmitting(2, 3);

    const auto outcome = step(state, 0, PolicyKind::Naive);
    EXPECT_FALSE(outcome.state.node(2).transmitting);
    EXPECT_EQ(outcome.state.node(0).transmittingTo, 1);
}

TEST(StatelessStepTest, RejectsInconsistentState) {
    auto nodes = initialize(3, 2).nodes();
    nodes[2].chunks.pop_back();
    EXPECT_THROW(step(NetworkState(nodes), 0, PolicyKind::Smart), InvalidStateError);
    EXPECT_THROW(initialize(1, 1), ConfigurationError);
}

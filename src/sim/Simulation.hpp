#pragma once
#include "NetworkState.hpp"
#include "TransferPolicy.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <vector>

struct SimulationConfig;

enum class SimulationPhase
{
    Idle,
    Running,
    Completed
};

const char* phaseName(SimulationPhase phase);

// what a step did; `state` refers to the simulation that produced it
struct StepResult
{
    const NetworkState&   state;
    std::vector<Transfer> transfers;
    bool                  completed;
};

class Simulation
{
public:
    Simulation(int nodeCount, int chunkCount, PolicyKind policy);
    explicit Simulation(const SimulationConfig& config);
    // takes over a prepared state. throws InvalidStateError if malformed
    Simulation(NetworkState initial, PolicyKind policy);

    // one tick: clear markers, run the policy, advance the counter, check
    // completion. a no-op once completed
    StepResult step();

    // steps until complete and returns the tick count. throws
    // InvalidStateError if a tick moves nothing while data is still missing
    std::uint64_t runToCompletion();

    // fresh state, tick 0, Idle. chunk count and policy are kept
    void reset();
    void reset(int nodeCount);

    void setPolicy(PolicyKind kind);
    PolicyKind policy() const { return policy_->kind(); }

    SimulationPhase phase() const { return phase_; }
    bool completed() const { return phase_ == SimulationPhase::Completed; }

    // ticks executed so far; the propagation cycles once completed
    std::uint64_t tick() const { return tick_; }

    const NetworkState& state() const { return state_; }
    const std::vector<Transfer>& lastTransfers() const { return lastTransfers_; }

    // per-transfer trace lines, nullptr to disable
    void setTrace(std::ostream* out) { trace_ = out; }

private:
    void traceStep() const;

    NetworkState                    state_;
    std::unique_ptr<TransferPolicy> policy_;
    SimulationPhase                 phase_ = SimulationPhase::Idle;
    std::uint64_t                   tick_  = 0;
    std::vector<Transfer>           lastTransfers_;
    std::ostream*                   trace_ = nullptr;
};

// stateless form, for callers that thread the state and tick themselves

struct StepOutcome
{
    NetworkState          state;
    std::vector<Transfer> transfers;
    bool                  completed;
};

NetworkState initialize(int nodeCount, int chunkCount);

// validates `state` (InvalidStateError), then applies tick `tickIndex`.
// a complete input comes back untouched with completed = true
StepOutcome step(NetworkState state, std::uint64_t tickIndex, PolicyKind policy);

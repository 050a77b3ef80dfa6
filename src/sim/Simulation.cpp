#include "Simulation.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include <ostream>
#include <string>
#include <utility>

namespace {

std::vector<Transfer> advance(NetworkState& state, TransferPolicy& policy, std::uint64_t tick)
{
    // markers only describe the tick that is about to run
    state.clearTransmitting();
    return policy.apply(state, tick);
}

} // namespace

const char* phaseName(SimulationPhase phase)
{
    switch (phase) {
    case SimulationPhase::Idle:      return "idle";
    case SimulationPhase::Running:   return "running";
    case SimulationPhase::Completed: return "completed";
    }
    return "unknown";
}

Simulation::Simulation(int nodeCount, int chunkCount, PolicyKind policy)
    : state_(NetworkState::create(nodeCount, chunkCount)),
      policy_(makePolicy(policy))
{
}

Simulation::Simulation(const SimulationConfig& config)
    : Simulation(config.nodeCount, config.chunkCount, config.policy)
{
}

Simulation::Simulation(NetworkState initial, PolicyKind policy)
    : state_(std::move(initial)),
      policy_(makePolicy(policy))
{
    state_.validate();
}

StepResult Simulation::step()
{
    if (phase_ != SimulationPhase::Completed && isComplete(state_))
        phase_ = SimulationPhase::Completed;
    if (phase_ == SimulationPhase::Completed)
        return StepResult{ state_, {}, true };

    phase_         = SimulationPhase::Running;
    lastTransfers_ = advance(state_, *policy_, tick_);
    ++tick_;

    if (isComplete(state_))
        phase_ = SimulationPhase::Completed;

    if (trace_) traceStep();
    return StepResult{ state_, lastTransfers_, completed() };
}

std::uint64_t Simulation::runToCompletion()
{
    while (!completed()) {
        const auto result = step();
        if (!result.completed && result.transfers.empty()) {
            throw InvalidStateError("simulation stalled at tick " + std::to_string(tick_)
                                    + " with " + std::to_string(state_.totalPresent()) + " of "
                                    + std::to_string(state_.nodeCount() * state_.chunkCount())
                                    + " chunks placed");
        }
    }
    return tick_;
}

void Simulation::reset()
{
    reset(state_.nodeCount());
}

void Simulation::reset(int nodeCount)
{
    state_ = NetworkState::create(nodeCount, state_.chunkCount());
    phase_ = SimulationPhase::Idle;
    tick_  = 0;
    lastTransfers_.clear();
}

void Simulation::setPolicy(PolicyKind kind)
{
    if (kind != policy_->kind()) policy_ = makePolicy(kind);
}

void Simulation::traceStep() const
{
    std::ostream& out = *trace_;
    const auto tick = tick_ - 1;
    for (const auto& t : lastTransfers_) {
        out << "[Simulation] tick " << tick << ": node " << t.from
            << " -> node " << t.to << " (chunk " << t.chunk << ")\n";
    }
    if (completed()) {
        out << "[Simulation] " << policyName(policy_->kind())
            << " propagation complete after " << tick_ << " ticks\n";
    }
}

NetworkState initialize(int nodeCount, int chunkCount)
{
    return NetworkState::create(nodeCount, chunkCount);
}

StepOutcome step(NetworkState state, std::uint64_t tickIndex, PolicyKind policy)
{
    state.validate();
    if (isComplete(state))
        return StepOutcome{ std::move(state), {}, true };

    auto impl = makePolicy(policy);
    auto transfers = advance(state, *impl, tickIndex);
    const bool done = isComplete(state);
    return StepOutcome{ std::move(state), std::move(transfers), done };
}

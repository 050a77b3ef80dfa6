#pragma once
#include "TransferPolicy.hpp"

// node 0 is the only sender. it serves nodes 1..N-1 round robin, one chunk
// per tick, and moves to the next chunk after a full round.
class NaivePolicy : public TransferPolicy
{
public:
    PolicyKind kind() const override { return PolicyKind::Naive; }

    std::vector<Transfer> apply(NetworkState& state, std::uint64_t tick) override
    {
        if (state.nodeCount() < 2) return {};

        const auto receivers = static_cast<std::uint64_t>(state.nodeCount() - 1);
        const int  targetId  = static_cast<int>(tick % receivers) + 1;
        const auto chunkId   = tick / receivers;

        // every chunk already went out
        if (chunkId >= static_cast<std::uint64_t>(state.chunkCount()))
            return {};

        const int chunk = static_cast<int>(chunkId);
        state.markPresent(targetId, chunk);
        state.markTransmitting(0, targetId);
        return { Transfer{ 0, targetId, chunk } };
    }
};

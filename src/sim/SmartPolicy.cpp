#include "SmartPolicy.hpp"

int SmartPolicy::pickReceiver(const NetworkState& state, int sender)
{
    const Node& source = state.node(sender);

    int bestId     = -1;
    int bestChunks = 0;
    for (const auto& candidate : state.nodes()) {
        if (candidate.id == sender || candidate.transmitting) continue;
        if (!candidate.needsFrom(source)) continue;

        // strict < keeps the lowest id on ties
        const int chunks = candidate.presentCount();
        if (bestId == -1 || chunks < bestChunks) {
            bestId     = candidate.id;
            bestChunks = chunks;
        }
    }
    return bestId;
}

std::vector<Transfer> SmartPolicy::apply(NetworkState& state, std::uint64_t /*tick*/)
{
    // senders are fixed before anything moves: a node getting its first
    // chunk this tick waits for the next one
    std::vector<int> senders;
    for (const auto& n : state.nodes()) {
        if (n.hasAny() && !n.transmitting) senders.push_back(n.id);
    }

    std::vector<Transfer> transfers;
    for (int sender : senders) {
        const int receiver = pickReceiver(state, sender);
        if (receiver == -1) continue;

        const int chunk = state.node(receiver).firstNeededFrom(state.node(sender));
        state.markPresent(receiver, chunk);
        state.markTransmitting(sender, receiver);
        transfers.push_back(Transfer{ sender, receiver, chunk });
    }
    return transfers;
}

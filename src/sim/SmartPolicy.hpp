#pragma once
#include "TransferPolicy.hpp"

// every node holding data sends one chunk per tick to the peer with the
// fewest chunks among those still missing something it has.
//
// senders are folded over in ascending id against the live state, so a
// sender sees what lower ids already did this tick. nodes that sent this
// tick are not receivers; a node may receive from several senders.
class SmartPolicy : public TransferPolicy
{
public:
    PolicyKind kind() const override { return PolicyKind::Smart; }

    std::vector<Transfer> apply(NetworkState& state, std::uint64_t tick) override;

    // receiver `sender` would pick in `state` right now, -1 if none
    static int pickReceiver(const NetworkState& state, int sender);
};

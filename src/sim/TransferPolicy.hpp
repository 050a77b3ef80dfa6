#pragma once
#include "NetworkState.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

enum class PolicyKind
{
    Naive,
    Smart
};

class TransferPolicy
{
public:
    virtual ~TransferPolicy() = default;

    virtual PolicyKind kind() const = 0;

    // applies this tick's transfers to `state` in place, setting the
    // sender markers, and returns them in the order they were applied.
    // expects the markers to be clear on entry
    virtual std::vector<Transfer> apply(NetworkState& state, std::uint64_t tick) = 0;
};

std::unique_ptr<TransferPolicy> makePolicy(PolicyKind kind);

const char* policyName(PolicyKind kind);

// "naive" or "smart", case-insensitive. throws ConfigurationError otherwise
PolicyKind parsePolicyKind(const std::string& name);

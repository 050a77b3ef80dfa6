#pragma once
#include "Node.hpp"
#include <utility>
#include <vector>

class NetworkState
{
public:
    // node 0 holds every chunk, nodes 1..N-1 hold none.
    // throws ConfigurationError if nodeCount < 2 or chunkCount < 1
    static NetworkState create(int nodeCount, int chunkCount);

    NetworkState() = default;
    explicit NetworkState(std::vector<Node> nodes)
        : nodes_(std::move(nodes)) {}

    int nodeCount() const { return static_cast<int>(nodes_.size()); }
    int chunkCount() const;

    const Node& node(int id) const;
    const std::vector<Node>& nodes() const { return nodes_; }

    int totalPresent() const;
    int nodesWithData() const;
    int transmittingCount() const;

    // returns true if the flag changed
    bool markPresent(int nodeId, int chunkId);
    void markTransmitting(int fromId, int toId);
    void clearTransmitting();

    // throws InvalidStateError on a malformed state
    void validate() const;

    bool operator==(const NetworkState& o) const;
    bool operator!=(const NetworkState& o) const { return !(*this == o); }

private:
    Node& mutableNode(int id);

    std::vector<Node> nodes_;
};

// true iff every node holds every chunk
bool isComplete(const NetworkState& state);

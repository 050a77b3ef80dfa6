#include "NetworkState.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <string>

NetworkState NetworkState::create(int nodeCount, int chunkCount)
{
    if (nodeCount < 2) {
        throw ConfigurationError("node count must be at least 2, got "
                                 + std::to_string(nodeCount));
    }
    if (chunkCount < 1) {
        throw ConfigurationError("chunk count must be at least 1, got "
                                 + std::to_string(chunkCount));
    }

    std::vector<Node> nodes;
    nodes.reserve(static_cast<std::size_t>(nodeCount));
    for (int i = 0; i < nodeCount; ++i) {
        Node node;
        node.id = i;
        node.chunks.reserve(static_cast<std::size_t>(chunkCount));
        for (int j = 0; j < chunkCount; ++j)
            node.chunks.push_back(Chunk{ j, i == 0 });
        nodes.push_back(std::move(node));
    }
    return NetworkState(std::move(nodes));
}

int NetworkState::chunkCount() const
{
    if (nodes_.empty()) return 0;
    return static_cast<int>(nodes_.front().chunks.size());
}

const Node& NetworkState::node(int id) const
{
    if (id < 0 || id >= nodeCount())
        throw InvalidStateError("node id out of range: " + std::to_string(id));
    return nodes_[static_cast<std::size_t>(id)];
}

Node& NetworkState::mutableNode(int id)
{
    if (id < 0 || id >= nodeCount())
        throw InvalidStateError("node id out of range: " + std::to_string(id));
    return nodes_[static_cast<std::size_t>(id)];
}

int NetworkState::totalPresent() const
{
    int total = 0;
    for (const auto& n : nodes_) total += n.presentCount();
    return total;
}

int NetworkState::nodesWithData() const
{
    return static_cast<int>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const Node& n) { return n.hasAny(); }));
}

int NetworkState::transmittingCount() const
{
    return static_cast<int>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const Node& n) { return n.transmitting; }));
}

bool NetworkState::markPresent(int nodeId, int chunkId)
{
    Node& n = mutableNode(nodeId);
    if (chunkId < 0 || chunkId >= static_cast<int>(n.chunks.size()))
        throw InvalidStateError("chunk id out of range: " + std::to_string(chunkId));

    Chunk& c = n.chunks[static_cast<std::size_t>(chunkId)];
    if (c.present) return false;
    c.present = true;
    return true;
}

void NetworkState::markTransmitting(int fromId, int toId)
{
    mutableNode(toId); // range check only
    Node& from = mutableNode(fromId);
    from.transmitting   = true;
    from.transmittingTo = toId;
}

void NetworkState::clearTransmitting()
{
    for (auto& n : nodes_) {
        n.transmitting = false;
        n.transmittingTo.reset();
    }
}

void NetworkState::validate() const
{
    if (nodes_.size() < 2) {
        throw InvalidStateError("state holds " + std::to_string(nodes_.size())
                                + " nodes, need at least 2");
    }

    const std::size_t chunks = nodes_.front().chunks.size();
    if (chunks == 0)
        throw InvalidStateError("state holds no chunks");

    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const Node& n = nodes_[i];
        if (n.id != static_cast<int>(i)) {
            throw InvalidStateError("node at index " + std::to_string(i)
                                    + " has id " + std::to_string(n.id));
        }
        if (n.chunks.size() != chunks) {
            throw InvalidStateError("node " + std::to_string(n.id) + " has "
                                    + std::to_string(n.chunks.size()) + " chunks, expected "
                                    + std::to_string(chunks));
        }
        for (std::size_t j = 0; j < chunks; ++j) {
            if (n.chunks[j].id != static_cast<int>(j)) {
                throw InvalidStateError("node " + std::to_string(n.id)
                                        + " has chunk id " + std::to_string(n.chunks[j].id)
                                        + " at index " + std::to_string(j));
            }
        }
    }
}

bool NetworkState::operator==(const NetworkState& o) const
{
    if (nodes_.size() != o.nodes_.size()) return false;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const Node& a = nodes_[i];
        const Node& b = o.nodes_[i];
        if (a.id != b.id || a.transmitting != b.transmitting
            || a.transmittingTo != b.transmittingTo
            || a.chunks.size() != b.chunks.size())
            return false;
        for (std::size_t j = 0; j < a.chunks.size(); ++j) {
            if (a.chunks[j].id != b.chunks[j].id
                || a.chunks[j].present != b.chunks[j].present)
                return false;
        }
    }
    return true;
}

bool isComplete(const NetworkState& state)
{
    const auto& nodes = state.nodes();
    return std::all_of(nodes.begin(), nodes.end(),
        [](const Node& n) { return n.hasAll(); });
}

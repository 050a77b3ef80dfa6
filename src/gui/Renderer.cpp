#include "Renderer.hpp"
#include <algorithm>
#include <cmath>

namespace {

const sf::Color kBackgroundNode(70, 70, 70);
const sf::Color kFullNode(100, 200, 100);
const sf::Color kTransmitting(250, 210, 80);
const sf::Color kChunkPresent(120, 170, 250);
const sf::Color kChunkMissing(90, 90, 90);

sf::Color lerp(const sf::Color& a, const sf::Color& b, float t)
{
    auto mix = [t](sf::Uint8 x, sf::Uint8 y) {
        return static_cast<sf::Uint8>(x + (static_cast<float>(y) - x) * t);
    };
    return sf::Color(mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b));
}

} // namespace

Renderer::Renderer(sf::RenderWindow& window, const Simulation& simulation)
    : window_(window), simulation_(simulation)
{
    updateLayout();
}

const NodeVisual* Renderer::findNodeVisual(int nodeId) const
{
    for (const auto& v : visuals_) {
        if (v.nodeId == nodeId) return &v;
    }
    return nullptr;
}

float Renderer::nodeRadius() const
{
    // shrink nodes so neighbours on the circle do not overlap
    const std::size_t n = visuals_.size();
    if (n < 2) return 14.f;
    const sf::Vector2f a = visuals_[0].position;
    const sf::Vector2f b = visuals_[1].position;
    const float gap = std::sqrt((a.x - b.x) * (a.x - b.x) + (a.y - b.y) * (a.y - b.y));
    return std::max(3.f, std::min(14.f, gap * 0.35f));
}

void Renderer::updateLayout()
{
    visuals_.clear();

    const sf::Vector2f center(
        window_.getSize().x / 2.f,
        window_.getSize().y / 2.f
    );
    const float radius =
        std::min(window_.getSize().x, window_.getSize().y) / 2.f - 40.f;

    const auto& nodes = simulation_.state().nodes();
    const std::size_t n = nodes.size();
    if (n == 0) return;

    // node 0 at the top, the rest clockwise
    for (std::size_t i = 0; i < n; ++i) {
        float angle =
            static_cast<float>(i) / static_cast<float>(n) * 2.f * 3.14159265f - 3.14159265f / 2.f;

        sf::Vector2f pos = {
            center.x + radius * std::cos(angle),
            center.y + radius * std::sin(angle)
        };

        visuals_.push_back(NodeVisual{ nodes[i].id, pos });
    }
}

void Renderer::drawChunkRing(const Node& node, const NodeVisual& v, float radius)
{
    // one dot per chunk around the node, clockwise from the top
    const std::size_t count = node.chunks.size();
    const float ring = radius + 4.f;
    const float dot  = std::max(1.f, std::min(2.5f, ring * 3.14159265f / count / 2.f));

    for (std::size_t i = 0; i < count; ++i) {
        float angle =
            static_cast<float>(i) / static_cast<float>(count) * 2.f * 3.14159265f - 3.14159265f / 2.f;

        sf::CircleShape c(dot);
        c.setOrigin(dot, dot);
        c.setPosition(v.position.x + ring * std::cos(angle), v.position.y + ring * std::sin(angle));
        c.setFillColor(node.chunks[i].present ? kChunkPresent : kChunkMissing);
        window_.draw(c);
    }
}

void Renderer::draw()
{
    const NetworkState& state = simulation_.state();

    // draw this tick's transfers
    for (const auto& t : simulation_.lastTransfers()) {
        const NodeVisual* a = findNodeVisual(t.from);
        const NodeVisual* b = findNodeVisual(t.to);
        if (!a || !b) continue;

        sf::Vertex line[] = {
            sf::Vertex(a->position, kTransmitting),
            sf::Vertex(b->position, sf::Color::White)
        };
        window_.draw(line, 2, sf::Lines);
    }

    // draw nodes on top
    const float radius = nodeRadius();
    const int chunks = state.chunkCount();
    for (const auto& v : visuals_) {
        if (v.nodeId >= state.nodeCount()) continue;
        const Node& node = state.node(v.nodeId);

        sf::CircleShape circle(radius);
        circle.setOrigin(radius, radius);
        circle.setPosition(v.position);
        circle.setOutlineThickness(2.f);
        circle.setOutlineColor(node.transmitting ? kTransmitting : sf::Color::White);

        const float filled = chunks > 0
            ? static_cast<float>(node.presentCount()) / static_cast<float>(chunks)
            : 0.f;
        circle.setFillColor(lerp(kBackgroundNode, kFullNode, filled));
        window_.draw(circle);

        if (radius >= 6.f) drawChunkRing(node, v, radius);
    }
}

int Renderer::pickNode(const sf::Vector2f& p) const
{
    const float radius = nodeRadius();
    const float radius2 = radius * radius;

    for (const auto& v : visuals_) {
        sf::Vector2f d = p - v.position;
        if (d.x * d.x + d.y * d.y <= radius2 * 1.5f * 1.5f) {
            return v.nodeId;
        }
    }
    return -1;
}

#pragma once
#include <SFML/Graphics.hpp>
#include "../sim/Simulation.hpp"
#include <vector>

struct NodeVisual
{
    int nodeId;
    sf::Vector2f position;
};

class Renderer
{
public:
    Renderer(sf::RenderWindow& window, const Simulation& simulation);

    // call after the node count changed
    void updateLayout();
    void draw();

    int pickNode(const sf::Vector2f& point) const;
    const std::vector<NodeVisual>& visuals() const { return visuals_; }
private:
    const NodeVisual* findNodeVisual(int nodeId) const;
    float nodeRadius() const;
    void drawChunkRing(const Node& node, const NodeVisual& v, float radius);

    sf::RenderWindow&       window_;
    const Simulation&       simulation_;
    std::vector<NodeVisual> visuals_;
};

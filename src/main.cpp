#include <SFML/Graphics.hpp>
#include <cstdio>
#include <iostream>
#include <string>

#include "sim/Config.hpp"
#include "sim/Errors.hpp"
#include "sim/Simulation.hpp"
#include "gui/Renderer.hpp"

namespace {

std::string chunkMap(const Node& node)
{
    std::string s;
    for (const auto& c : node.chunks) s += c.present ? '1' : '0';
    return s;
}

std::string windowTitle(const SimulationConfig& config, const Simulation& sim, bool paused)
{
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "Chunk Propagation - %s | %d nodes | %.1fx | cycles %llu%s",
                  policyName(sim.policy()), sim.state().nodeCount(), config.speed,
                  static_cast<unsigned long long>(sim.tick()),
                  sim.completed() ? " | complete" : paused ? " | paused" : "");
    return buf;
}

int run(const CommandLine& cl)
{
    const unsigned WIDTH  = 1280;
    const unsigned HEIGHT = 720;

    SimulationConfig config = cl.config;

    sf::RenderWindow window(
        sf::VideoMode(WIDTH, HEIGHT),
        "Chunk Propagation"
    );
    window.setFramerateLimit(60);

    Simulation sim(config);
    if (cl.trace) sim.setTrace(&std::cout);
    Renderer   renderer(window, sim);

    bool paused = true;
    sf::Clock clock;
    sf::Clock runClock;      // wall clock since play was last pressed
    double sinceTick = 0.0;

    std::cout << "Controls:\n"
              << "  Space:       play/pause\n"
              << "  R:           reset\n"
              << "  N / S:       naive / smart policy\n"
              << "  Up / Down:   speed +/- " << kSpeedStep << "x\n"
              << "  Right / Left: nodes +/- 1 (while paused)\n"
              << "  Click:       print a node's chunks\n"
              << "  Esc:         quit\n";

    auto resetSim = [&]() {
        sim.reset(config.nodeCount);
        renderer.updateLayout();
        sinceTick = 0.0;
        std::cout << "Reset: " << config.nodeCount << " nodes, "
                  << config.chunkCount << " chunks\n";
    };

    // main loop
    while (window.isOpen()) {
        sf::Event event{};
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window.close();
            }
            if (event.type == sf::Event::MouseButtonPressed
                && event.mouseButton.button == sf::Mouse::Left) {
                const sf::Vector2f p(static_cast<float>(event.mouseButton.x),
                                     static_cast<float>(event.mouseButton.y));
                const int id = renderer.pickNode(p);
                if (id >= 0) {
                    const Node& node = sim.state().node(id);
                    std::cout << "[Node " << id << "] " << chunkMap(node) << " ("
                              << node.presentCount() << "/" << node.chunks.size() << ")\n";
                }
            }
            if (event.type == sf::Event::KeyPressed) {
                switch (event.key.code) {
                case sf::Keyboard::Escape:
                    window.close();
                    break;
                case sf::Keyboard::Space:
                    if (sim.completed()) break;
                    paused = !paused;
                    if (!paused) runClock.restart();
                    std::cout << (paused ? "Paused\n" : "Resumed\n");
                    break;
                case sf::Keyboard::R:
                    paused = true;
                    resetSim();
                    break;
                case sf::Keyboard::N:
                case sf::Keyboard::S:
                    config.policy = event.key.code == sf::Keyboard::N
                        ? PolicyKind::Naive : PolicyKind::Smart;
                    sim.setPolicy(config.policy);
                    std::cout << "Policy: " << policyName(config.policy) << "\n";
                    break;
                case sf::Keyboard::Up:
                case sf::Keyboard::Down:
                    config.changeSpeed(event.key.code == sf::Keyboard::Up ? 1 : -1);
                    std::cout << "Speed: " << config.speed << "x\n";
                    break;
                case sf::Keyboard::Right:
                case sf::Keyboard::Left:
                    if (!paused) break;
                    if (config.changeNodeCount(event.key.code == sf::Keyboard::Right ? 1 : -1))
                        resetSim();
                    break;
                default:
                    break;
                }
            }
        }

        double dtReal = clock.restart().asSeconds();
        if (dtReal > 0.1) dtReal = 0.1;

        if (!paused) {
            sinceTick += dtReal;
            if (sinceTick >= config.tickInterval()) {
                sinceTick = 0.0;
                const auto result = sim.step();
                if (result.completed) {
                    paused = true;
                    std::cout << "Simulation complete: " << sim.tick() << " propagation cycles in "
                              << runClock.getElapsedTime().asSeconds() << "s ("
                              << policyName(sim.policy()) << ", " << config.nodeCount
                              << " nodes)\n";
                }
            }
        }

        window.setTitle(windowTitle(config, sim, paused));
        window.clear(sf::Color(30, 30, 30));
        renderer.draw();
        window.display();
    }

    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    try {
        const CommandLine cl = parseCommandLine(argc, argv);
        if (cl.help) {
            std::cout << usage(argv[0]);
            return 0;
        }
        return run(cl);
    } catch (const ConfigurationError& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    } catch (const InvalidStateError& e) {
        std::cerr << "invalid state: " << e.what() << "\n";
        return 1;
    }
}

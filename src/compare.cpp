#include <iomanip>
#include <iostream>

#include "sim/Config.hpp"
#include "sim/Errors.hpp"
#include "sim/Simulation.hpp"

// runs both policies to completion for each node count and prints the
// propagation cycles each one needed
int main(int argc, char** argv)
{
    try {
        const CommandLine cl = parseCommandLine(argc, argv);
        if (cl.help) {
            std::cout << usage(argv[0]);
            return 0;
        }

        const int chunks = cl.config.chunkCount;
        std::cout << "Comparing naive and smart propagation of " << chunks << " chunks\n";

        for (int nodes : cl.sizes) {
            Simulation naive(nodes, chunks, PolicyKind::Naive);
            Simulation smart(nodes, chunks, PolicyKind::Smart);
            if (cl.trace) {
                naive.setTrace(&std::cout);
                smart.setTrace(&std::cout);
            }

            const auto naiveTicks = naive.runToCompletion();
            const auto smartTicks = smart.runToCompletion();

            std::cout << "nodes=" << std::setw(3) << nodes
                      << " naive=" << std::setw(5) << naiveTicks
                      << " smart=" << std::setw(4) << smartTicks
                      << " speedup=" << std::fixed << std::setprecision(1)
                      << static_cast<double>(naiveTicks) / static_cast<double>(smartTicks)
                      << "x\n";
            std::cout.unsetf(std::ios::floatfield);
        }
        return 0;
    } catch (const ConfigurationError& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    } catch (const InvalidStateError& e) {
        std::cerr << "invalid state: " << e.what() << "\n";
        return 1;
    }
}

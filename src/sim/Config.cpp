#include "Config.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

int parseInt(const std::string& flag, const std::string& value)
{
    std::size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigurationError(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size())
        throw ConfigurationError(flag + " expects an integer, got '" + value + "'");
    return result;
}

double parseDouble(const std::string& flag, const std::string& value)
{
    std::size_t used = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &used);
    } catch (const std::exception&) {
        throw ConfigurationError(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size())
        throw ConfigurationError(flag + " expects a number, got '" + value + "'");
    return result;
}

std::vector<int> parseSizes(const std::string& value)
{
    std::vector<int> sizes;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ','))
        sizes.push_back(parseInt("--sizes", item));
    if (sizes.empty())
        throw ConfigurationError("--sizes expects a comma separated list of node counts");
    return sizes;
}

} // namespace

void SimulationConfig::validate() const
{
    if (nodeCount < kMinNodeCount || nodeCount > kMaxNodeCount) {
        throw ConfigurationError("node count must be in [" + std::to_string(kMinNodeCount)
                                 + ", " + std::to_string(kMaxNodeCount) + "], got "
                                 + std::to_string(nodeCount));
    }
    if (chunkCount < 1 || chunkCount > kMaxChunkCount) {
        throw ConfigurationError("chunk count must be in [1, " + std::to_string(kMaxChunkCount)
                                 + "], got " + std::to_string(chunkCount));
    }
    // small slack for values produced by changeSpeed
    if (!(speed >= kMinSpeed - 1e-9 && speed <= kMaxSpeed + 1e-9)) {
        std::ostringstream msg;
        msg << "speed must be in [" << kMinSpeed << ", " << kMaxSpeed << "], got " << speed;
        throw ConfigurationError(msg.str());
    }
}

void SimulationConfig::changeSpeed(int steps)
{
    const double next = std::round((speed + steps * kSpeedStep) * 10.0) / 10.0;
    speed = std::clamp(next, kMinSpeed, kMaxSpeed);
}

bool SimulationConfig::changeNodeCount(int delta)
{
    const int next = std::clamp(nodeCount + delta, kMinNodeCount, kMaxNodeCount);
    if (next == nodeCount) return false;
    nodeCount = next;
    return true;
}

CommandLine parseCommandLine(int argc, const char* const* argv)
{
    CommandLine cl;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigurationError(arg + " expects a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cl.help = true;
        } else if (arg == "--trace") {
            cl.trace = true;
        } else if (arg == "--nodes") {
            cl.config.nodeCount = parseInt(arg, value());
        } else if (arg == "--chunks") {
            cl.config.chunkCount = parseInt(arg, value());
        } else if (arg == "--policy") {
            cl.config.policy = parsePolicyKind(value());
        } else if (arg == "--speed") {
            cl.config.speed = parseDouble(arg, value());
        } else if (arg == "--sizes") {
            cl.sizes = parseSizes(value());
        } else {
            throw ConfigurationError("unknown option '" + arg + "'");
        }
    }

    cl.config.validate();
    for (int n : cl.sizes) {
        SimulationConfig probe = cl.config;
        probe.nodeCount = n;
        probe.validate();
    }
    return cl;
}

std::string usage(const std::string& program)
{
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --nodes N        node count, " << kMinNodeCount << ".." << kMaxNodeCount
        << " (default " << kDefaultNodeCount << ")\n"
        << "  --chunks C       chunks per node, 1.." << kMaxChunkCount
        << " (default " << kDefaultChunkCount << ")\n"
        << "  --policy P       naive or smart (default naive)\n"
        << "  --speed X        tick speed multiplier, " << kMinSpeed << ".." << kMaxSpeed
        << " (default 1.0)\n"
        << "  --sizes a,b,c    node counts to compare (default 5,10,20,50)\n"
        << "  --trace          print every transfer\n"
        << "  --help           show this text\n";
    return out.str();
}

#pragma once
#include "TransferPolicy.hpp"
#include <string>
#include <vector>

constexpr int    kDefaultNodeCount  = 50;
constexpr int    kMinNodeCount      = 2;
constexpr int    kMaxNodeCount      = 100;
constexpr int    kDefaultChunkCount = 16;
constexpr int    kMaxChunkCount     = 256;
constexpr double kBaseIntervalSec   = 1.0; // one tick per second at 1x
constexpr double kMinSpeed          = 0.5;
constexpr double kMaxSpeed          = 2.0;
constexpr double kSpeedStep         = 0.1;

struct SimulationConfig
{
    int        nodeCount  = kDefaultNodeCount;
    int        chunkCount = kDefaultChunkCount;
    PolicyKind policy     = PolicyKind::Naive;
    double     speed      = 1.0;

    // throws ConfigurationError
    void validate() const;

    // wall-clock seconds between two ticks
    double tickInterval() const { return kBaseIntervalSec / speed; }

    // moves speed by `steps` * 0.1 within [0.5, 2.0]
    void changeSpeed(int steps);

    // moves node count by `delta` within [2, 100]; false if it was already
    // at the bound
    bool changeNodeCount(int delta);
};

struct CommandLine
{
    SimulationConfig config;
    std::vector<int> sizes = { 5, 10, 20, 50 }; // comparison tool only
    bool             trace = false;
    bool             help  = false;
};

// --nodes N --chunks C --policy naive|smart --speed X --sizes a,b,c
// --trace --help. throws ConfigurationError on anything malformed
CommandLine parseCommandLine(int argc, const char* const* argv);

std::string usage(const std::string& program);

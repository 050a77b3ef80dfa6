#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

struct Chunk
{
    int  id;
    bool present = false; // false -> true once, never back
};

// one chunk copied from one node to another during a tick
struct Transfer
{
    int from;
    int to;
    int chunk;

    bool operator==(const Transfer& o) const
    {
        return from == o.from && to == o.to && chunk == o.chunk;
    }
    bool operator!=(const Transfer& o) const { return !(*this == o); }
};

struct Node
{
    int id;
    std::vector<Chunk> chunks;

    // tick-scoped, cleared by the engine before every policy run
    bool               transmitting = false;
    std::optional<int> transmittingTo;

    bool has(int chunk) const { return chunks[static_cast<std::size_t>(chunk)].present; }

    int presentCount() const
    {
        return static_cast<int>(std::count_if(chunks.begin(), chunks.end(),
            [](const Chunk& c) { return c.present; }));
    }

    bool hasAny() const
    {
        return std::any_of(chunks.begin(), chunks.end(),
            [](const Chunk& c) { return c.present; });
    }

    bool hasAll() const
    {
        return std::all_of(chunks.begin(), chunks.end(),
            [](const Chunk& c) { return c.present; });
    }

    // lowest chunk index present on `source` and missing here, -1 if none
    int firstNeededFrom(const Node& source) const
    {
        const std::size_t n = std::min(chunks.size(), source.chunks.size());
        for (std::size_t i = 0; i < n; ++i) {
            if (source.chunks[i].present && !chunks[i].present)
                return static_cast<int>(i);
        }
        return -1;
    }

    bool needsFrom(const Node& source) const { return firstNeededFrom(source) != -1; }
};

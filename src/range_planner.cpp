#include "range_planner.hpp"

#include <algorithm>

std::vector<ByteRange> RangePlanner::plan(std::optional<std::uint64_t> totalLength,
                                          int parallelism,
                                          RangeSupport supportsRanges)
{
    if (supportsRanges != RangeSupport::Yes || !totalLength || *totalLength == 0)
    {
        return {ByteRange::whole()};
    }

    const std::uint64_t length = *totalLength;

    // Every range holds at least one byte
    std::uint64_t parts = static_cast<std::uint64_t>(std::max(parallelism, 1));
    parts = std::min(parts, length);

    const std::uint64_t partSize = length / parts;

    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<size_t>(parts));

    std::uint64_t start = 0;
    for (std::uint64_t i = 0; i < parts; ++i)
    {
        // Last range absorbs the remainder
        std::uint64_t end = (i == parts - 1) ? length - 1 : start + partSize - 1;
        ranges.push_back(ByteRange{start, end, true});
        start = end + 1;
    }

    return ranges;
}

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "capability_prober.hpp"

/**
 * One planned part of the payload, inclusive on both ends.
 * An unbounded range stands for "the whole resource" and is fetched
 * without a Range header.
 */
struct ByteRange
{
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    bool bounded = true;

    std::uint64_t size() const { return bounded ? end - start + 1 : 0; }

    static ByteRange whole() { return ByteRange{0, 0, false}; }
};

/**
 * Splits a payload into contiguous, non-overlapping byte ranges.
 */
class RangePlanner
{
public:
    /**
     * Plan the ranges of a transfer.
     *
     * Falls back to a single unbounded range when the server does not
     * advertise byte ranges or the length is unknown or zero. Otherwise
     * returns min(parallelism, totalLength) ranges in ascending order;
     * the last one absorbs the remainder of the integer division and
     * ends exactly at totalLength - 1.
     *
     * @param totalLength Resource length from the probe, if known
     * @param parallelism Requested number of connections (< 1 is treated as 1)
     * @param supportsRanges Range support reported by the probe
     */
    static std::vector<ByteRange> plan(std::optional<std::uint64_t> totalLength,
                                       int parallelism,
                                       RangeSupport supportsRanges);
};

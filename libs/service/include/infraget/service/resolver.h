#pragma once

#include "infraget/index/spatialindex.h"

#include <cstdint>
#include <optional>

namespace infraget
{

/** Parameters of the expanding-ring nearest segment search. */
struct ResolverParams
{
    double initialRadius_ = 50.;
    double maxRadius_ = 2000.;
    size_t targetCandidates_ = 256;
};

/** Result of a nearest segment search. */
struct NearestMatch
{
    CanonicalSegment const* segment_ = nullptr;

    /** Exact distance from the query point to the segment geometry. */
    double distance_ = 0.;

    /** Radius of the last (largest) searched square. */
    double searchRadius_ = 0.;

    /** Number of index queries which were made. */
    uint32_t rounds_ = 0;
};

/**
 * Finds the indexed segment which is closest to a query point.
 *
 * Candidates are collected from squares of growing half side length r
 * around the query point: Starting at params.initialRadius_, r is doubled
 * (but never beyond params.maxRadius_) until params.targetCandidates_
 * distinct candidates were seen or the maximum radius was searched.
 * The candidate with the smallest exact distance wins, ties are broken
 * by the order in which candidates were first seen. If the winner is
 * further away than the last searched radius, one more square of radius
 * min(distance, maxRadius) is searched, so that no closer segment
 * can be missed.
 *
 * The resolver never throws. Degenerate parameters are replaced by
 * usable ones, and a non-finite query point yields no result.
 */
class NearestFeatureResolver
{
public:
    explicit NearestFeatureResolver(SpatialIndex const& index);

    [[nodiscard]] std::optional<NearestMatch> resolveNearest(
        Point const& point,
        ResolverParams const& params = {}) const;

private:
    SpatialIndex const& index_;
};

}

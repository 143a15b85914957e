#include "resolver.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>
#include <vector>

namespace infraget
{

namespace
{
ResolverParams sanitized(ResolverParams params)
{
    ResolverParams defaults;
    if (!std::isfinite(params.initialRadius_) || params.initialRadius_ <= 0.)
        params.initialRadius_ = defaults.initialRadius_;
    if (!std::isfinite(params.maxRadius_) || params.maxRadius_ < params.initialRadius_)
        params.maxRadius_ = params.initialRadius_;
    params.targetCandidates_ = std::max<size_t>(params.targetCandidates_, 1);
    return params;
}
}

NearestFeatureResolver::NearestFeatureResolver(SpatialIndex const& index) : index_(index) {}

std::optional<NearestMatch> NearestFeatureResolver::resolveNearest(
    Point const& point,
    ResolverParams const& requestedParams) const
{
    if (index_.empty() || !point.isFinite())
        return {};
    auto params = sanitized(requestedParams);

    std::unordered_set<CanonicalSegment const*> seen;
    std::vector<CanonicalSegment const*> candidates;
    NearestMatch match;
    match.distance_ = std::numeric_limits<double>::infinity();

    auto searchRound = [&](double radius)
    {
        ++match.rounds_;
        match.searchRadius_ = radius;
        for (auto const* segment : index_.query(BBox::around(point, radius))) {
            if (!seen.insert(segment).second)
                continue;
            candidates.push_back(segment);
            auto distance = segment->distanceTo(point);
            if (distance < match.distance_) {
                match.distance_ = distance;
                match.segment_ = segment;
            }
        }
    };

    auto radius = params.initialRadius_;
    while (true) {
        searchRound(radius);
        if (candidates.size() >= params.targetCandidates_ || radius >= params.maxRadius_)
            break;
        radius = std::min(radius * 2., params.maxRadius_);
    }

    if (!match.segment_)
        return {};

    if (match.distance_ > match.searchRadius_ && match.searchRadius_ < params.maxRadius_)
        searchRound(std::min(match.distance_, params.maxRadius_));

    // Segments beyond the maximum radius were not all searched.
    if (match.distance_ > params.maxRadius_)
        return {};

    return match;
}

}

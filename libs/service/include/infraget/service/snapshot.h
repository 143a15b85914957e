#pragma once

#include "resolver.h"
#include "infraget/index/spatialindex.h"

#include <map>
#include <memory>
#include <optional>

namespace infraget
{

/**
 * Selects the index which a nearest segment search runs on:
 * The index over the segments of one service category, or
 * (if std::nullopt) the index over all segments.
 */
using DatasetSelector = std::optional<ServiceCategory>;

/**
 * Immutable pair of a canonical store and the spatial indices built over
 * it. A snapshot is built completely before it is handed out, and never
 * modified afterwards, so any number of threads may query it concurrently.
 */
class Snapshot
{
public:
    using Ptr = std::shared_ptr<const Snapshot>;

    /**
     * Take ownership of the store and build all indices. An empty store
     * yields an empty snapshot. Raises FatalStartupError if the store is
     * non-empty, but none of its segments can be indexed.
     */
    explicit Snapshot(CanonicalStore store);

    Snapshot(Snapshot const&) = delete;
    Snapshot& operator=(Snapshot const&) = delete;

    /** Convenience function to build a shared snapshot. */
    static Ptr create(CanonicalStore store);

    [[nodiscard]] CanonicalStore const& store() const;

    /** Index for a selector. Categories without segments have an empty index. */
    [[nodiscard]] SpatialIndex const& index(DatasetSelector const& selector = std::nullopt) const;

    /** Find the nearest segment among those selected by the selector. */
    [[nodiscard]] std::optional<NearestMatch> resolveNearest(
        Point const& point,
        DatasetSelector const& selector = std::nullopt,
        ResolverParams const& params = {}) const;

private:
    CanonicalStore store_;
    SpatialIndex any_;
    std::map<ServiceCategory, SpatialIndex> byCategory_;
};

}

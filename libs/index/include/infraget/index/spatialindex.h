#pragma once

#include "infraget/model/store.h"

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace infraget
{

/**
 * Static bounding-box index over the segments of a canonical store.
 * The index is bulk-loaded once (packed R-tree) and never modified
 * afterwards. It holds raw pointers into the store it was built from,
 * so the store must outlive the index.
 */
class SpatialIndex
{
public:
    using Ptr = std::shared_ptr<const SpatialIndex>;
    using Filter = std::function<bool(CanonicalSegment const&)>;

    /**
     * Build an index over all segments of the store which have a usable
     * bounding box and pass the (optional) filter.
     */
    explicit SpatialIndex(CanonicalStore const& store, Filter const& filter = {});

    /** Build an index over the segments which carry the given category. */
    SpatialIndex(CanonicalStore const& store, ServiceCategory category);

    /** Segments whose bounding box intersects the given rectangle. */
    [[nodiscard]] std::vector<CanonicalSegment const*> query(BBox const& rect) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    /** Bounding box over all indexed segments, if any. */
    [[nodiscard]] std::optional<BBox> bounds() const;

private:
    using BoostPoint = boost::geometry::model::point<double, 2, boost::geometry::cs::cartesian>;
    using BoostBox = boost::geometry::model::box<BoostPoint>;
    using Entry = std::pair<BoostBox, CanonicalSegment const*>;
    using Tree = boost::geometry::index::rtree<Entry, boost::geometry::index::rstar<16>>;

    static std::vector<Entry> collect(CanonicalStore const& store, Filter const& filter);

    Tree tree_;
};

}

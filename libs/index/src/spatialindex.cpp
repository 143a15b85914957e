#include "spatialindex.h"
#include "infraget/log.h"

#include <iterator>

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

namespace infraget
{

namespace
{
using BoostPoint = bg::model::point<double, 2, bg::cs::cartesian>;
using BoostBox = bg::model::box<BoostPoint>;

BoostBox toBoost(BBox const& b)
{
    auto n = b.normalized();
    return BoostBox(BoostPoint(n.p1.x, n.p1.y), BoostPoint(n.p2.x, n.p2.y));
}
}

std::vector<SpatialIndex::Entry> SpatialIndex::collect(CanonicalStore const& store, Filter const& filter)
{
    std::vector<Entry> entries;
    entries.reserve(store.size());
    size_t excluded = 0;
    for (auto const& [id, segment] : store) {
        if (filter && !filter(segment))
            continue;
        auto bbox = segment.bbox();
        if (!bbox) {
            ++excluded;
            continue;
        }
        entries.emplace_back(toBoost(*bbox), &segment);
    }
    if (excluded)
        log().debug("{} segments have no usable geometry and are not indexed.", excluded);
    return entries;
}

SpatialIndex::SpatialIndex(CanonicalStore const& store, Filter const& filter)
    // The range constructor uses the packing algorithm.
    : tree_(collect(store, filter))
{
}

SpatialIndex::SpatialIndex(CanonicalStore const& store, ServiceCategory category)
    : SpatialIndex(store, [category](auto const& segment) { return segment.hasService(category); })
{
}

std::vector<CanonicalSegment const*> SpatialIndex::query(BBox const& rect) const
{
    std::vector<Entry> hits;
    tree_.query(bgi::intersects(toBoost(rect)), std::back_inserter(hits));

    std::vector<CanonicalSegment const*> result;
    result.reserve(hits.size());
    for (auto const& [box, segment] : hits)
        result.push_back(segment);
    return result;
}

size_t SpatialIndex::size() const
{
    return tree_.size();
}

bool SpatialIndex::empty() const
{
    return tree_.empty();
}

std::optional<BBox> SpatialIndex::bounds() const
{
    if (tree_.empty())
        return {};
    auto b = tree_.bounds();
    return BBox{
        {bg::get<bg::min_corner, 0>(b), bg::get<bg::min_corner, 1>(b)},
        {bg::get<bg::max_corner, 0>(b), bg::get<bg::max_corner, 1>(b)}};
}

}

#include "snapshot.h"
#include "infraget/log.h"

namespace infraget
{

Snapshot::Snapshot(CanonicalStore store) : store_(std::move(store)), any_(store_)
{
    if (!store_.empty() && any_.empty())
        raiseFmt<FatalStartupError>(
            "None of the {} segments has a usable geometry, the spatial index cannot be built.",
            store_.size());

    for (auto category : AllServiceCategories)
        byCategory_.emplace(category, SpatialIndex(store_, category));

    log().debug("Built spatial index over {} of {} segments.", any_.size(), store_.size());
    for (auto const& [category, index] : byCategory_)
        log().debug("  {}: {} segments.", toString(category), index.size());
}

Snapshot::Ptr Snapshot::create(CanonicalStore store)
{
    return std::make_shared<const Snapshot>(std::move(store));
}

CanonicalStore const& Snapshot::store() const
{
    return store_;
}

SpatialIndex const& Snapshot::index(DatasetSelector const& selector) const
{
    if (!selector)
        return any_;
    return byCategory_.at(*selector);
}

std::optional<NearestMatch> Snapshot::resolveNearest(
    Point const& point,
    DatasetSelector const& selector,
    ResolverParams const& params) const
{
    return NearestFeatureResolver(index(selector)).resolveNearest(point, params);
}

}

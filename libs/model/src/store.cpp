#include "store.h"

namespace infraget
{

CanonicalSegment& CanonicalStore::upsert(std::string const& id)
{
    auto [it, inserted] = segments_.try_emplace(id);
    if (inserted)
        it->second.id_ = id;
    return it->second;
}

void CanonicalStore::insert(CanonicalSegment segment)
{
    auto id = segment.id_;
    segments_.insert_or_assign(std::move(id), std::move(segment));
}

CanonicalSegment const* CanonicalStore::find(std::string const& id) const
{
    auto it = segments_.find(id);
    if (it == segments_.end())
        return nullptr;
    return &it->second;
}

size_t CanonicalStore::size() const
{
    return segments_.size();
}

bool CanonicalStore::empty() const
{
    return segments_.empty();
}

CanonicalStore::SegmentMap::const_iterator CanonicalStore::begin() const
{
    return segments_.begin();
}

CanonicalStore::SegmentMap::const_iterator CanonicalStore::end() const
{
    return segments_.end();
}

nlohmann::json CanonicalStore::coverage() const
{
    int64_t withoutGeometry = 0;
    std::map<ServiceCategory, int64_t> perCategory;
    for (auto const& [id, segment] : segments_) {
        if (!segment.bbox())
            ++withoutGeometry;
        for (auto const& [category, fields] : segment.services_)
            ++perCategory[category];
    }

    auto categories = nlohmann::json::object();
    for (auto category : AllServiceCategories)
        categories[std::string(toString(category))] = perCategory[category];

    return {
        {"segments", static_cast<int64_t>(segments_.size())},
        {"without-geometry", withoutGeometry},
        {"categories", categories}
    };
}

}

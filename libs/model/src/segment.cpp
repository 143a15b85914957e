#include "segment.h"

namespace infraget
{

namespace
{

constexpr std::array<std::string_view, AllServiceCategories.size()> categoryNames = {
    "lighting",
    "curb",
    "paving",
    "water",
    "sewage",
    "electricity",
    "telephony",
    "selective-collection"
};

constexpr std::array<std::string_view, FieldCount> fieldNames = {
    "indicator",
    "type",
    "date",
    "schedule",
    "shift",
    "district",
    "responsible-party"
};

}

std::string_view toString(ServiceCategory category)
{
    return categoryNames[static_cast<size_t>(category)];
}

std::optional<ServiceCategory> serviceCategoryFromString(std::string_view name)
{
    for (auto category : AllServiceCategories) {
        if (toString(category) == name)
            return category;
    }
    return {};
}

std::string_view toString(Field field)
{
    return fieldNames[static_cast<size_t>(field)];
}

std::optional<Field> fieldFromString(std::string_view name)
{
    for (auto field : AllFields) {
        if (toString(field) == name)
            return field;
    }
    return {};
}

std::optional<std::string> const& ServiceFields::get(Field f) const
{
    return values_[static_cast<size_t>(f)];
}

void ServiceFields::set(Field f, std::optional<std::string> value)
{
    values_[static_cast<size_t>(f)] = std::move(value);
}

ServiceFields const* CanonicalSegment::service(ServiceCategory category) const
{
    auto it = services_.find(category);
    if (it == services_.end())
        return nullptr;
    return &it->second;
}

bool CanonicalSegment::hasService(ServiceCategory category) const
{
    return services_.contains(category);
}

std::optional<BBox> CanonicalSegment::bbox() const
{
    return geometry_.bbox();
}

double CanonicalSegment::distanceTo(Point const& p) const
{
    return geometry_.distanceTo(p);
}

}

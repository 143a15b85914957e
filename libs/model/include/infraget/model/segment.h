#pragma once

#include "geometry.h"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace infraget
{

/** Infrastructure service categories which are ingested per segment. */
enum class ServiceCategory : uint8_t {
    Lighting,
    Curb,
    Paving,
    Water,
    Sewage,
    Electricity,
    Telephony,
    SelectiveCollection
};

static constexpr std::array<ServiceCategory, 8> AllServiceCategories = {
    ServiceCategory::Lighting,
    ServiceCategory::Curb,
    ServiceCategory::Paving,
    ServiceCategory::Water,
    ServiceCategory::Sewage,
    ServiceCategory::Electricity,
    ServiceCategory::Telephony,
    ServiceCategory::SelectiveCollection
};

/** Stable name of a category, e.g. "selective-collection". */
std::string_view toString(ServiceCategory category);

/** Parse a category name as returned by toString(). */
std::optional<ServiceCategory> serviceCategoryFromString(std::string_view name);

/** Per-service attributes of a segment. */
enum class Field : uint8_t {
    Indicator,
    Type,
    Date,
    Schedule,
    Shift,
    District,
    ResponsibleParty
};

static constexpr size_t FieldCount = 7;

static constexpr std::array<Field, FieldCount> AllFields = {
    Field::Indicator,
    Field::Type,
    Field::Date,
    Field::Schedule,
    Field::Shift,
    Field::District,
    Field::ResponsibleParty
};

/** Stable name of a field, e.g. "responsible-party". */
std::string_view toString(Field field);

std::optional<Field> fieldFromString(std::string_view name);

/**
 * Field values which one service category contributes to a segment.
 * A field is std::nullopt if the contributing dataset has no such column,
 * and an (possibly empty) string otherwise.
 */
struct ServiceFields
{
    std::array<std::optional<std::string>, FieldCount> values_;

    [[nodiscard]] std::optional<std::string> const& get(Field f) const;
    void set(Field f, std::optional<std::string> value);

    bool operator==(ServiceFields const&) const = default;
};

/**
 * One street segment after aggregation. Owns its geometry and
 * the fields of every service category it appeared in.
 */
struct CanonicalSegment
{
    std::string id_;
    MultiLineString geometry_;
    std::map<ServiceCategory, ServiceFields> services_;

    /** Fields for a category, or nullptr if the segment does not carry it. */
    [[nodiscard]] ServiceFields const* service(ServiceCategory category) const;

    [[nodiscard]] bool hasService(ServiceCategory category) const;

    /** Bounding box over all usable geometry parts, if any. */
    [[nodiscard]] std::optional<BBox> bbox() const;

    /** Minimum distance from p to the segment's geometry. */
    [[nodiscard]] double distanceTo(Point const& p) const;

    bool operator==(CanonicalSegment const&) const = default;
};

}

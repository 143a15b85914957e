#pragma once

#include "infraget/model/segment.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace infraget
{

/** Availability of one infrastructure service at a location. */
enum class Availability : uint8_t {
    Available,
    Unavailable,
    /** The indicator column exists, but the value is blank. */
    Unknown,
    /** No segment matched, or the indicator is absent or unrecognized. */
    NotFound
};

/** Stable name of an availability state, e.g. "not-found". */
std::string_view toString(Availability availability);

/** Value reported for pass-through fields which are blank or absent. */
static constexpr std::string_view NotInformed = "não informado";

/**
 * Map a raw indicator value to an availability state. The value is
 * trimmed and compared case-insensitively:
 * - S, SIM, Y, 1, TRUE: Available
 * - N, NAO, NÃO, 0, FALSE: Unavailable
 * - blank: Unknown
 * - anything else, or an absent value: NotFound
 */
Availability mapBinaryIndicator(std::optional<std::string> const& value);

/** Pass-through fields which are reported for a service category. */
std::vector<Field> const& passThroughFields(ServiceCategory category);

/**
 * Resolve the reported value of a pass-through field:
 * - std::nullopt if no segment matched,
 * - NotInformed if the segment lacks the category or field, or the value is blank,
 * - the trimmed field value otherwise.
 */
std::optional<std::string> resolveField(CanonicalSegment const* matched, ServiceCategory category, Field field);

/** Availability state and pass-through fields of one service category. */
struct AvailabilityDescriptor
{
    ServiceCategory category_ = ServiceCategory::Lighting;
    Availability availability_ = Availability::NotFound;

    /** Exactly the category's pass-through fields. */
    std::map<Field, std::optional<std::string>> fields_;

    [[nodiscard]] std::optional<std::string> field(Field f) const;

    /**
     * Serialize as {"availability": ..., "<field>": value|null, ...}.
     * Fields which the category does not report are omitted.
     */
    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * Translate the fields of the matched segment (or nullptr if none
 * matched) into the availability descriptor of a service category.
 *
 * Paving: An indicator which is neither Available nor Unavailable is
 * overridden with Available if a non-blank paving type exists.
 *
 * Selective collection has no indicator column: Unavailable if the
 * schedule contains "SEM COLETA", else Available if any of schedule,
 * shift, district or responsible party holds a meaningful value
 * (not blank and not a not-applicable token), else NotFound.
 */
AvailabilityDescriptor mapIndicator(ServiceCategory category, CanonicalSegment const* matched);

}

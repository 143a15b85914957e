#pragma once

#include "infraget/model/geometry.h"

#include <memory>
#include <optional>
#include <string_view>

namespace infraget
{

/**
 * Converts the raw geometry serialization of a dataset row
 * into line strings.
 */
class GeometryParser
{
public:
    using Ptr = std::shared_ptr<GeometryParser>;

    virtual ~GeometryParser() = default;

    /**
     * Parse a geometry. Returns nullopt if the text is blank, cannot be
     * parsed, is of an unsupported geometry type, or holds no coordinate.
     */
    [[nodiscard]] virtual std::optional<MultiLineString> parse(std::string_view text) const = 0;
};

/**
 * Parses LINESTRING and MULTILINESTRING well-known text, with optional
 * Z coordinates (which are dropped).
 */
class WktGeometryParser : public GeometryParser
{
public:
    [[nodiscard]] std::optional<MultiLineString> parse(std::string_view text) const override;
};

}

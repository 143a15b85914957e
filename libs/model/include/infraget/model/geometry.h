#pragma once

#include "point.h"

#include <optional>
#include <string>
#include <vector>

namespace infraget
{

struct BBox;
struct LineString;
struct MultiLineString;

/**
 * Axis-aligned rectangle. After normalized(), p1 holds the
 * minimum and p2 the maximum coordinates.
 */
struct BBox
{
    Point p1, p2;

    /** Square with the given half side length around a center point. */
    static auto around(const Point& center, double radius) -> BBox;

    auto normalized() const -> BBox;

    auto intersects(const BBox& b) const -> bool;

    /** Grow this box so that it also encloses the other one. */
    auto expand(const BBox& b) -> void;

    auto operator==(const BBox&) const -> bool;
};

struct LineString
{
    std::vector<Point> points;

    /** Copy of this line string without non-finite coordinates. */
    auto validPoints() const -> std::vector<Point>;

    /** A line string is usable if it has at least two valid coordinates. */
    auto usable() const -> bool;

    /** Bounding box over the valid coordinates. Only meaningful if usable(). */
    auto bbox() const -> BBox;

    /**
     * Minimum Euclidean distance from p to any segment between consecutive
     * valid vertices. Infinity if the line string is not usable.
     */
    auto distanceTo(const Point& p) const -> double;

    auto operator==(const LineString&) const -> bool;
};

/**
 * Geometry of a canonical segment: one or more polylines.
 */
struct MultiLineString
{
    std::vector<LineString> parts;

    /** True if no part holds any coordinate. */
    auto empty() const -> bool;

    /** Bounding box over all usable parts, or nullopt if there is none. */
    auto bbox() const -> std::optional<BBox>;

    /** Minimum distance over all usable parts, infinity if there is none. */
    auto distanceTo(const Point& p) const -> double;

    /** Serialize as LINESTRING (single part) or MULTILINESTRING WKT. */
    auto toWkt() const -> std::string;

    auto operator==(const MultiLineString&) const -> bool;
};

/**
 * Distance from p to the segment ab: p is projected onto the line through
 * a and b, the projection parameter is clamped to [0,1], and the distance
 * to the clamped point is returned. A degenerate segment (a == b) yields
 * the distance to a.
 */
auto pointToSegmentDistance(const Point& p, const Point& a, const Point& b) -> double;

}

#include "geometry.h"

#include "fmt/format.h"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace std::string_literals;

namespace infraget
{

static auto dot(const glm::dvec2& a, const glm::dvec2& b)
{
    return a.x*b.x + a.y*b.y;
}

auto pointToSegmentDistance(const Point& p, const Point& a, const Point& b) -> double
{
    auto ab = glm::dvec2{b.x - a.x, b.y - a.y};
    auto ap = glm::dvec2{p.x - a.x, p.y - a.y};

    auto ab2 = dot(ab, ab);
    if (ab2 == 0)
        return std::hypot(ap.x, ap.y);

    auto t = std::clamp(dot(ap, ab) / ab2, 0.0, 1.0);
    auto cx = a.x + t * ab.x;
    auto cy = a.y + t * ab.y;
    return std::hypot(p.x - cx, p.y - cy);
}

auto BBox::around(const Point& center, double radius) -> BBox
{
    return {{center.x - radius, center.y - radius}, {center.x + radius, center.y + radius}};
}

auto BBox::normalized() const -> BBox
{
    auto minx = std::min<double>(p1.x, p2.x);
    auto maxx = std::max<double>(p1.x, p2.x);
    auto miny = std::min<double>(p1.y, p2.y);
    auto maxy = std::max<double>(p1.y, p2.y);

    return {{minx, miny}, {maxx, maxy}};
}

auto BBox::intersects(const BBox& o) const -> bool
{
    auto a = normalized();
    auto b = o.normalized();

    return b.p2.x >= a.p1.x && b.p1.x <= a.p2.x &&
           b.p2.y >= a.p1.y && b.p1.y <= a.p2.y;
}

auto BBox::expand(const BBox& o) -> void
{
    auto b = o.normalized();
    *this = normalized();
    p1.x = std::min(p1.x, b.p1.x);
    p1.y = std::min(p1.y, b.p1.y);
    p2.x = std::max(p2.x, b.p2.x);
    p2.y = std::max(p2.y, b.p2.y);
}

auto BBox::operator==(const BBox& o) const -> bool
{
    return p1 == o.p1 && p2 == o.p2;
}

auto LineString::validPoints() const -> std::vector<Point>
{
    std::vector<Point> result;
    result.reserve(points.size());
    std::copy_if(points.begin(), points.end(), std::back_inserter(result),
        [](auto const& p) { return p.isFinite(); });
    return result;
}

auto LineString::usable() const -> bool
{
    auto count = std::count_if(points.begin(), points.end(),
        [](auto const& p) { return p.isFinite(); });
    return count >= 2;
}

auto LineString::bbox() const -> BBox
{
    auto minx = std::numeric_limits<double>::max();
    auto maxx = std::numeric_limits<double>::lowest();
    auto miny = std::numeric_limits<double>::max();
    auto maxy = std::numeric_limits<double>::lowest();

    auto valid = validPoints();
    if (valid.empty())
        return {{0, 0}, {0, 0}};

    for (const auto& p : valid) {
        minx = std::min(minx, p.x);
        maxx = std::max(maxx, p.x);
        miny = std::min(miny, p.y);
        maxy = std::max(maxy, p.y);
    }

    return {{minx, miny}, {maxx, maxy}};
}

auto LineString::distanceTo(const Point& p) const -> double
{
    auto valid = validPoints();
    auto result = std::numeric_limits<double>::infinity();
    if (valid.size() < 2)
        return result;

    for (auto i = 1u; i < valid.size(); ++i)
        result = std::min(result, pointToSegmentDistance(p, valid[i-1], valid[i]));
    return result;
}

auto LineString::operator==(const LineString& o) const -> bool
{
    return points == o.points;
}

auto MultiLineString::empty() const -> bool
{
    return std::all_of(parts.begin(), parts.end(),
        [](auto const& part) { return part.points.empty(); });
}

auto MultiLineString::bbox() const -> std::optional<BBox>
{
    std::optional<BBox> result;
    for (const auto& part : parts) {
        if (!part.usable())
            continue;
        if (!result)
            result = part.bbox();
        else
            result->expand(part.bbox());
    }
    return result;
}

auto MultiLineString::distanceTo(const Point& p) const -> double
{
    auto result = std::numeric_limits<double>::infinity();
    for (const auto& part : parts)
        result = std::min(result, part.distanceTo(p));
    return result;
}

auto MultiLineString::toWkt() const -> std::string
{
    auto coordinates = [](LineString const& ls) {
        auto str = "("s;
        auto i = 0;
        for (const auto& p : ls.points) {
            if (i++ > 0)
                str += ", ";
            str += fmt::format("{} {}", p.x, p.y);
        }
        return str + ")";
    };

    if (parts.empty())
        return "LINESTRING EMPTY";
    if (parts.size() == 1)
        return "LINESTRING " + coordinates(parts.front());

    auto str = "MULTILINESTRING ("s;
    auto i = 0;
    for (const auto& part : parts) {
        if (i++ > 0)
            str += ", ";
        str += coordinates(part);
    }
    return str + ")";
}

auto MultiLineString::operator==(const MultiLineString& o) const -> bool
{
    return parts == o.parts;
}

}

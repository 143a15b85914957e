#pragma once

#include <fmt/core.h>
#include <cmath>
#include <string>

#include "glm/glm.hpp"
#include "nlohmann/json.hpp"

namespace infraget
{

/**
 * Concept which is used to construct points
 * from arbitrary other compatible structures.
 */
template <typename T, typename Precision>
concept HasXY = requires(T t) {
    { t.x } -> std::convertible_to<Precision>;
    { t.y } -> std::convertible_to<Precision>;
};

/**
 * Minimal 2D point structure. Coordinates are expressed in the planar
 * reference system of the ingested datasets, so that the Euclidean
 * distance between two points approximates metres.
 */
struct Point : public glm::dvec2
{
    /** Define trivial constructors */
    Point();
    Point(Point const&) = default;
    Point& operator=(Point const&) = default;
    Point(double const& x, double const& y);

    /**
     * Allow constructing a point from any class which has .x and .y members.
     */
    template <typename T>
    requires HasXY<T, double>
    Point(T const& other) : glm::dvec2(other.x, other.y)  // NOLINT: Allow implicit conversion
    {
    }

    [[nodiscard]] std::string toString() const;

    /** True if both coordinates are finite numbers. */
    [[nodiscard]] bool isFinite() const;

    bool operator==(const Point& o) const;
};

/** nlohmann::json bindings */
void to_json(nlohmann::json& j, const Point& p);

}

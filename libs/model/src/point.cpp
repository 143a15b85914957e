#include "point.h"

namespace infraget
{

Point::Point() : glm::dvec2(.0, .0) {}

Point::Point(const double& x, const double& y) : glm::dvec2(x, y) {}

std::string Point::toString() const
{
    return fmt::format("[{},{}]", x, y);
}

bool Point::isFinite() const
{
    return std::isfinite(x) && std::isfinite(y);
}

bool Point::operator==(const Point& o) const
{
    return x == o.x && y == o.y;
}

void to_json(nlohmann::json& j, const Point& p)
{
    j = nlohmann::json::array({p.x, p.y});
}

}

#include "geometryparser.h"
#include "csvreader.h"
#include "infraget/log.h"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/io/wkt/read.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace bg = boost::geometry;

namespace infraget
{

namespace
{

template <size_t Dimensions>
using WktPoint = bg::model::point<double, Dimensions, bg::cs::cartesian>;

template <size_t Dimensions>
using WktLineString = bg::model::linestring<WktPoint<Dimensions>>;

template <size_t Dimensions>
using WktMultiLineString = bg::model::multi_linestring<WktLineString<Dimensions>>;

template <size_t Dimensions>
LineString toLineString(WktLineString<Dimensions> const& ls)
{
    LineString result;
    result.points.reserve(ls.size());
    for (auto const& p : ls)
        result.points.emplace_back(bg::get<0>(p), bg::get<1>(p));
    return result;
}

template <size_t Dimensions>
MultiLineString readWkt(std::string const& wkt, bool multi)
{
    MultiLineString result;
    if (multi) {
        WktMultiLineString<Dimensions> mls;
        bg::read_wkt(wkt, mls);
        for (auto const& ls : mls)
            result.parts.push_back(toLineString<Dimensions>(ls));
    }
    else {
        WktLineString<Dimensions> ls;
        bg::read_wkt(wkt, ls);
        result.parts.push_back(toLineString<Dimensions>(ls));
    }
    return result;
}

/** Upper-case leading keyword(s) of the WKT, up to the first parenthesis. */
std::string keywords(std::string const& wkt)
{
    auto end = wkt.find('(');
    auto result = wkt.substr(0, end);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trim(result);
}

}

std::optional<MultiLineString> WktGeometryParser::parse(std::string_view text) const
{
    auto wkt = trim(text);
    if (wkt.empty())
        return {};

    auto prefix = keywords(wkt);
    bool multi = prefix.rfind("MULTILINESTRING", 0) == 0;
    if (!multi && prefix.rfind("LINESTRING", 0) != 0) {
        log().trace("Unsupported geometry type: {}", prefix);
        return {};
    }
    if (prefix.find("EMPTY") != std::string::npos)
        return {};

    // Boost expects the bare type keyword, so a Z dimension tag
    // is removed and a three-dimensional point type is used instead.
    bool withZ = prefix.ends_with("Z");
    if (withZ) {
        auto open = wkt.find('(');
        if (open == std::string::npos)
            return {};
        wkt = (multi ? "MULTILINESTRING" : "LINESTRING") + wkt.substr(open);
    }

    try {
        auto result = withZ ? readWkt<3>(wkt, multi) : readWkt<2>(wkt, multi);
        if (result.empty())
            return {};
        return result;
    }
    catch (bg::read_wkt_exception const& e) {
        log().trace("Could not parse WKT: {}", e.what());
    }
    return {};
}

}

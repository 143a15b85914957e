#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <limits>
#include <random>

#include "infraget/service/resolver.h"
#include "infraget/service/snapshot.h"
#include "utility.h"

using namespace infraget;
using Catch::Matchers::WithinAbs;

namespace
{

/** Nearest segment by linear scan, ties broken by store order. */
std::pair<CanonicalSegment const*, double> bruteForceNearest(CanonicalStore const& store, Point const& p)
{
    std::pair<CanonicalSegment const*, double> result{nullptr, std::numeric_limits<double>::infinity()};
    for (auto const& [id, segment] : store) {
        if (!segment.bbox())
            continue;
        auto d = segment.distanceTo(p);
        if (d < result.second)
            result = {&segment, d};
    }
    return result;
}

}

TEST_CASE("Expanding ring search", "[Resolver]")
{
    CanonicalStore store;
    ResolverParams params;
    params.targetCandidates_ = 1;

    SECTION("Candidate within the first ring")
    {
        store.insert(test::makeSegment("near", {{-100, 40}, {100, 40}}));
        SpatialIndex index(store);
        auto match = NearestFeatureResolver(index).resolveNearest({0, 0}, params);
        REQUIRE(match);
        REQUIRE(match->segment_->id_ == "near");
        REQUIRE_THAT(match->distance_, WithinAbs(40., 1e-9));
        REQUIRE(match->rounds_ == 1);
        REQUIRE(match->searchRadius_ == 50.);
    }

    SECTION("Candidate found after the radius doubled three times")
    {
        store.insert(test::makeSegment("far", {{-100, 300}, {100, 300}}));
        SpatialIndex index(store);
        auto match = NearestFeatureResolver(index).resolveNearest({0, 0}, params);
        REQUIRE(match);
        REQUIRE(match->segment_->id_ == "far");
        REQUIRE_THAT(match->distance_, WithinAbs(300., 1e-9));
        REQUIRE(match->rounds_ == 4);
        REQUIRE(match->searchRadius_ == 400.);
    }

    SECTION("Radius is clamped to the maximum")
    {
        store.insert(test::makeSegment("far", {{-100, 300}, {100, 300}}));
        SpatialIndex index(store);
        params.maxRadius_ = 250.;
        auto match = NearestFeatureResolver(index).resolveNearest({0, 0}, params);
        REQUIRE_FALSE(match);

        params.maxRadius_ = 300.;
        match = NearestFeatureResolver(index).resolveNearest({0, 0}, params);
        REQUIRE(match);
        REQUIRE(match->searchRadius_ == 300.);
        REQUIRE(match->rounds_ == 4);
    }

    SECTION("Closing query finds a nearer segment outside the early candidates")
    {
        // The bbox of the diagonal intersects the first ring, but its line is far away.
        store.insert(test::makeSegment("diagonal", {{-40, 1000}, {1000, -40}}));
        store.insert(test::makeSegment("straight", {{-200, 80}, {200, 80}}));
        SpatialIndex index(store);
        auto match = NearestFeatureResolver(index).resolveNearest({0, 0}, params);
        REQUIRE(match);
        REQUIRE(match->segment_->id_ == "straight");
        REQUIRE_THAT(match->distance_, WithinAbs(80., 1e-9));
        REQUIRE(match->rounds_ == 2);
    }

    SECTION("Nearest candidate beyond the maximum radius is not returned")
    {
        // Only the bbox of the diagonal reaches the searched square.
        store.insert(test::makeSegment("diagonal", {{-90, 1000}, {1000, -90}}));
        store.insert(test::makeSegment("straight", {{-200, 150}, {200, 150}}));
        SpatialIndex index(store);
        params.maxRadius_ = 100.;
        REQUIRE_FALSE(NearestFeatureResolver(index).resolveNearest({0, 0}, params));

        params.maxRadius_ = 150.;
        auto match = NearestFeatureResolver(index).resolveNearest({0, 0}, params);
        REQUIRE(match);
        REQUIRE(match->segment_->id_ == "straight");
        REQUIRE_THAT(match->distance_, WithinAbs(150., 1e-9));
    }
}

TEST_CASE("Resolver agrees with a linear scan", "[Resolver]")
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> coordinate(-3000., 3000.);
    std::uniform_real_distribution<double> offset(-150., 150.);
    std::uniform_int_distribution<int> vertexCount(2, 5);

    CanonicalStore store;
    for (auto i = 0; i < 300; ++i) {
        std::vector<Point> points{{coordinate(rng), coordinate(rng)}};
        auto n = vertexCount(rng);
        for (auto v = 1; v < n; ++v)
            points.emplace_back(points.back().x + offset(rng), points.back().y + offset(rng));
        store.insert(test::makeSegment(std::to_string(i), points));
    }
    SpatialIndex index(store);
    NearestFeatureResolver resolver(index);

    ResolverParams params;
    params.maxRadius_ = 20000.;

    for (auto q = 0; q < 200; ++q) {
        Point p{coordinate(rng), coordinate(rng)};
        auto expected = bruteForceNearest(store, p);

        for (size_t target : {size_t(1), size_t(8), size_t(256)}) {
            params.targetCandidates_ = target;
            auto match = resolver.resolveNearest(p, params);
            REQUIRE(match);
            REQUIRE(match->distance_ == expected.second);
        }
    }
}

TEST_CASE("Resolver edge cases", "[Resolver]")
{
    SECTION("Empty store")
    {
        auto snapshot = Snapshot::create(CanonicalStore{});
        REQUIRE_NOTHROW(snapshot->resolveNearest({0, 0}));
        REQUIRE_FALSE(snapshot->resolveNearest({0, 0}));
        REQUIRE_FALSE(snapshot->resolveNearest({1e7, -1e7}, ServiceCategory::Water));
    }

    CanonicalStore store;
    store.insert(test::makeSegment("first", {{-10, 10}, {10, 10}}));
    store.insert(test::makeSegment("second", {{-10, -10}, {10, -10}}));
    SpatialIndex index(store);
    NearestFeatureResolver resolver(index);

    SECTION("Repeated queries are deterministic")
    {
        auto first = resolver.resolveNearest({0, 0});
        REQUIRE(first);
        for (auto i = 0; i < 10; ++i) {
            auto again = resolver.resolveNearest({0, 0});
            REQUIRE(again->segment_ == first->segment_);
            REQUIRE(again->distance_ == first->distance_);
            REQUIRE(again->rounds_ == first->rounds_);
        }
        REQUIRE(first->distance_ == 10.);
    }

    SECTION("Nothing within the maximum radius")
    {
        ResolverParams params;
        params.maxRadius_ = 100.;
        REQUIRE_FALSE(resolver.resolveNearest({5000, 5000}, params));
    }

    SECTION("Degenerate parameters and points")
    {
        ResolverParams params;
        params.initialRadius_ = -1.;
        params.maxRadius_ = std::numeric_limits<double>::quiet_NaN();
        params.targetCandidates_ = 0;
        auto match = resolver.resolveNearest({0, 5}, params);
        REQUIRE(match);
        REQUIRE(match->segment_->id_ == "first");

        REQUIRE_FALSE(resolver.resolveNearest({std::numeric_limits<double>::infinity(), 0}));
    }
}

#pragma once

#include "indicator.h"
#include "snapshot.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace infraget
{

/** Settings of an InfraService. */
struct ServiceConfig
{
    /** Search parameters used for every category. */
    ResolverParams resolver_;

    /**
     * Maximum distance at which the nearest segment of a category still
     * counts as a match. Can be overridden per category.
     */
    double defaultThreshold_ = 50.;
    std::map<ServiceCategory, double> thresholds_;

    /** Categories which are resolved by lookup(). */
    std::vector<ServiceCategory> categories_{AllServiceCategories.begin(), AllServiceCategories.end()};

    [[nodiscard]] double threshold(ServiceCategory category) const;
};

/** Lookup result for one service category. */
struct CategoryLookup
{
    AvailabilityDescriptor descriptor_;

    /** Set if a segment matched within the category's threshold. */
    std::optional<std::string> segmentId_;
    std::optional<double> distance_;

    [[nodiscard]] nlohmann::json toJson() const;
};

/** Availability of all requested service categories at one point. */
struct LookupResult
{
    Point point_;
    std::vector<CategoryLookup> categories_;

    [[nodiscard]] CategoryLookup const* find(ServiceCategory category) const;

    /** Serialize as {"point": [x,y], "services": {"<category>": {...}}}. */
    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * Answers availability lookups on the current snapshot. The snapshot
 * can be replaced at any time using reload(): Lookups which are already
 * running keep the snapshot they started with, later lookups see the
 * new one. A lookup never sees a partially built snapshot.
 */
class InfraService
{
public:
    /** Construct a service. The snapshot must not be null. */
    explicit InfraService(Snapshot::Ptr snapshot, ServiceConfig config = {});
    ~InfraService();

    /** Atomically replace the current snapshot. */
    void reload(Snapshot::Ptr snapshot);

    /** The snapshot which is currently used for new lookups. */
    [[nodiscard]] Snapshot::Ptr snapshot() const;

    /**
     * Resolve the availability of all configured categories at the point.
     * The categories are resolved concurrently.
     */
    [[nodiscard]] LookupResult lookup(Point const& point) const;

    /** Resolve the availability of the given categories. */
    [[nodiscard]] LookupResult lookup(Point const& point, std::vector<ServiceCategory> const& categories) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}

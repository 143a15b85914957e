#include "service.h"
#include "infraget/log.h"

#include <future>
#include <mutex>
#include <shared_mutex>

namespace infraget
{

double ServiceConfig::threshold(ServiceCategory category) const
{
    auto it = thresholds_.find(category);
    if (it != thresholds_.end())
        return it->second;
    return defaultThreshold_;
}

nlohmann::json CategoryLookup::toJson() const
{
    auto result = descriptor_.toJson();
    if (segmentId_)
        result["segment-id"] = *segmentId_;
    if (distance_)
        result["distance"] = *distance_;
    return result;
}

CategoryLookup const* LookupResult::find(ServiceCategory category) const
{
    for (auto const& entry : categories_)
        if (entry.descriptor_.category_ == category)
            return &entry;
    return nullptr;
}

nlohmann::json LookupResult::toJson() const
{
    auto services = nlohmann::json::object();
    for (auto const& entry : categories_)
        services[std::string(toString(entry.descriptor_.category_))] = entry.toJson();
    return nlohmann::json::object({{"point", point_}, {"services", services}});
}

struct InfraService::Impl
{
    ServiceConfig config_;
    Snapshot::Ptr snapshot_;
    mutable std::shared_mutex snapshotMutex_;

    Impl(Snapshot::Ptr snapshot, ServiceConfig config)
        : config_(std::move(config)), snapshot_(std::move(snapshot))
    {
    }

    Snapshot::Ptr current() const
    {
        std::shared_lock lock(snapshotMutex_);
        return snapshot_;
    }

    [[nodiscard]] CategoryLookup resolve(
        Snapshot const& snapshot,
        Point const& point,
        ServiceCategory category) const
    {
        CategoryLookup result;
        auto match = snapshot.resolveNearest(point, category, config_.resolver_);
        if (match && match->distance_ <= config_.threshold(category)) {
            result.segmentId_ = match->segment_->id_;
            result.distance_ = match->distance_;
            result.descriptor_ = mapIndicator(category, match->segment_);
        }
        else
            result.descriptor_ = mapIndicator(category, nullptr);

        if (match)
            log().trace(
                "{} at {}: nearest segment {} at {:.2f} after {} rounds (r={}).",
                toString(category),
                point.toString(),
                match->segment_->id_,
                match->distance_,
                match->rounds_,
                match->searchRadius_);
        return result;
    }
};

InfraService::InfraService(Snapshot::Ptr snapshot, ServiceConfig config)
{
    if (!snapshot)
        raise<std::invalid_argument>("InfraService requires a snapshot.");
    impl_ = std::make_unique<Impl>(std::move(snapshot), std::move(config));
}

InfraService::~InfraService() = default;

void InfraService::reload(Snapshot::Ptr snapshot)
{
    if (!snapshot)
        raise<std::invalid_argument>("Cannot reload InfraService with a null snapshot.");
    {
        std::unique_lock lock(impl_->snapshotMutex_);
        impl_->snapshot_.swap(snapshot);
    }
    // The previous snapshot is released here, or by the last lookup using it.
    log().info("Switched to a snapshot with {} segments.", impl_->current()->store().size());
}

Snapshot::Ptr InfraService::snapshot() const
{
    return impl_->current();
}

LookupResult InfraService::lookup(Point const& point) const
{
    return lookup(point, impl_->config_.categories_);
}

LookupResult InfraService::lookup(Point const& point, std::vector<ServiceCategory> const& categories) const
{
    auto snapshot = impl_->current();

    std::vector<std::future<CategoryLookup>> pending;
    pending.reserve(categories.size());
    for (auto category : categories) {
        pending.emplace_back(std::async(
            std::launch::async,
            [this, &snapshot, &point, category]
            { return impl_->resolve(*snapshot, point, category); }));
    }

    LookupResult result;
    result.point_ = point;
    result.categories_.reserve(pending.size());
    for (auto& future : pending)
        result.categories_.push_back(future.get());
    return result;
}

}

#pragma once

#include "segment.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace infraget
{

/**
 * Raised when no usable data is available at startup, e.g. because
 * aggregation produced an empty store, or no segment can be indexed.
 */
class FatalStartupError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Mapping from segment id to canonical segment. The store exclusively
 * owns its segments. It is filled once (by the aggregator or by loading
 * a persisted store), and treated as immutable afterwards: spatial indices
 * keep raw pointers to the contained segments.
 */
class CanonicalStore
{
public:
    using Ptr = std::shared_ptr<const CanonicalStore>;
    using SegmentMap = std::map<std::string, CanonicalSegment>;

    CanonicalStore() = default;
    CanonicalStore(CanonicalStore&&) = default;
    CanonicalStore& operator=(CanonicalStore&&) = default;
    CanonicalStore(CanonicalStore const&) = delete;
    CanonicalStore& operator=(CanonicalStore const&) = delete;

    /**
     * Get the segment with the given id, inserting an empty one
     * if it does not exist yet.
     */
    CanonicalSegment& upsert(std::string const& id);

    /** Insert or replace a fully formed segment. */
    void insert(CanonicalSegment segment);

    [[nodiscard]] CanonicalSegment const* find(std::string const& id) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    /** Segments in ascending id order. */
    [[nodiscard]] SegmentMap::const_iterator begin() const;
    [[nodiscard]] SegmentMap::const_iterator end() const;

    /**
     * Summary of the store contents:
     * - `segments`: Number of segments.
     * - `without-geometry`: Segments without a usable bounding box.
     * - `categories`: Number of segments per service category.
     */
    [[nodiscard]] nlohmann::json coverage() const;

private:
    SegmentMap segments_;
};

}

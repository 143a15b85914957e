#pragma once

#include "dataset.h"
#include "geometryparser.h"
#include "infraget/model/store.h"

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "nlohmann/json.hpp"

namespace infraget
{

/** Counters which the aggregator collects for one dataset. */
struct DatasetStatistics
{
    std::string name_;
    ServiceCategory category_ = ServiceCategory::Lighting;
    bool missing_ = false;
    size_t rowsRead_ = 0;
    size_t rowsMerged_ = 0;
    size_t malformedRows_ = 0;
    size_t geometryErrors_ = 0;
    size_t geometryConflicts_ = 0;
    std::unordered_set<std::string> segmentIds_;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * Merges the rows of several per-service datasets into one canonical
 * segment per segment id. Merge policy for rows sharing a segment id:
 * - Fields: The first non-empty value wins. A blank value is only kept
 *   if no non-empty value is ever seen.
 * - Date fields: The most recent non-empty value wins.
 * - Geometry: The first successfully parsed geometry is kept, later
 *   geometries for the same id are ignored.
 * Rows without a segment id or without a parsable geometry are skipped
 * and counted. A missing dataset file contributes no rows.
 */
class Aggregator
{
public:
    explicit Aggregator(GeometryParser::Ptr parser = std::make_shared<WktGeometryParser>());

    /**
     * Read and merge the dataset file at descriptor.path_. A missing
     * file is logged and recorded in the statistics, but is not an error.
     */
    DatasetStatistics const& addDataset(DatasetDescriptor const& descriptor);

    /** Read and merge delimited rows from a stream. */
    DatasetStatistics const& addDataset(DatasetDescriptor const& descriptor, std::istream& input);

    /**
     * Merge a single record.
     * @return false if the record was skipped.
     */
    bool addRecord(DatasetDescriptor const& descriptor, RawFeatureRecord const& record);

    /** Statistics of all datasets added so far. */
    [[nodiscard]] std::vector<DatasetStatistics> const& statistics() const;

    /** Statistics as JSON, including the store coverage. */
    [[nodiscard]] nlohmann::json report() const;

    /**
     * Hand out the aggregated store. Raises FatalStartupError if the
     * store is empty. The aggregator is empty afterwards.
     */
    CanonicalStore finish();

private:
    bool addRecord(DatasetDescriptor const& descriptor, RawFeatureRecord const& record, DatasetStatistics& stats);
    DatasetStatistics& newStatistics(DatasetDescriptor const& descriptor);

    GeometryParser::Ptr parser_;
    CanonicalStore store_;
    std::vector<DatasetStatistics> statistics_;
};

/**
 * Key under which dates are compared. Dates in dd/mm/yyyy notation
 * (optionally followed by a time) are rewritten as yyyy-mm-dd, so that
 * both notations order chronologically. Other values are used as-is.
 */
std::string dateSortKey(std::string_view date);

/**
 * Merge an incoming field value into the current one, following
 * the aggregation policy for the given field.
 */
void mergeField(Field field, std::optional<std::string>& current, std::optional<std::string> const& incoming);

}

#include "aggregator.h"
#include "csvreader.h"
#include "infraget/log.h"

#include <algorithm>
#include <fstream>

namespace infraget
{

nlohmann::json DatasetStatistics::toJson() const
{
    return nlohmann::json::object({
        {"name", name_},
        {"category", std::string(toString(category_))},
        {"missing", missing_},
        {"rows-read", rowsRead_},
        {"rows-merged", rowsMerged_},
        {"malformed-rows", malformedRows_},
        {"geometry-errors", geometryErrors_},
        {"geometry-conflicts", geometryConflicts_},
        {"distinct-segments", segmentIds_.size()},
    });
}

std::string dateSortKey(std::string_view date)
{
    auto isDigits = [&](size_t from, size_t count)
    {
        for (auto i = from; i < from + count; ++i)
            if (date[i] < '0' || date[i] > '9')
                return false;
        return true;
    };

    // dd/mm/yyyy, optionally followed by a time.
    if (date.size() >= 10 && date[2] == '/' && date[5] == '/' &&
        isDigits(0, 2) && isDigits(3, 2) && isDigits(6, 4)) {
        return fmt::format(
            "{}-{}-{}{}",
            date.substr(6, 4),
            date.substr(3, 2),
            date.substr(0, 2),
            date.substr(10));
    }
    return std::string(date);
}

void mergeField(Field field, std::optional<std::string>& current, std::optional<std::string> const& incoming)
{
    if (!incoming)
        return;
    if (!current || current->empty()) {
        if (!current || !incoming->empty())
            current = incoming;
        return;
    }
    if (incoming->empty())
        return;
    if (field == Field::Date && dateSortKey(*incoming) > dateSortKey(*current))
        current = incoming;
}

Aggregator::Aggregator(GeometryParser::Ptr parser) : parser_(std::move(parser))
{
    if (!parser_)
        raise<std::invalid_argument>("Aggregator requires a geometry parser.");
}

DatasetStatistics& Aggregator::newStatistics(DatasetDescriptor const& descriptor)
{
    auto& stats = statistics_.emplace_back();
    stats.name_ = descriptor.name();
    stats.category_ = descriptor.category();
    return stats;
}

DatasetStatistics const& Aggregator::addDataset(DatasetDescriptor const& descriptor)
{
    std::ifstream input(descriptor.path_, std::ios::binary);
    if (!input) {
        log().warn("Dataset {} could not be opened, skipping it.", descriptor.name());
        auto& stats = newStatistics(descriptor);
        stats.missing_ = true;
        return stats;
    }
    return addDataset(descriptor, input);
}

DatasetStatistics const& Aggregator::addDataset(DatasetDescriptor const& descriptor, std::istream& input)
{
    auto& stats = newStatistics(descriptor);
    log().info("Reading dataset {}...", stats.name_);

    CsvReader reader(input, descriptor.separator_);
    auto const& header = reader.header();
    if (std::find(header.begin(), header.end(), descriptor.idColumn_) == header.end())
        log().warn("Dataset {} has no id column {}.", stats.name_, descriptor.idColumn_);
    if (std::find(header.begin(), header.end(), descriptor.geometryColumn_) == header.end())
        log().warn("Dataset {} has no geometry column {}.", stats.name_, descriptor.geometryColumn_);

    std::vector<std::string> row;
    while (reader.next(row)) {
        ++stats.rowsRead_;
        if (row.size() < header.size()) {
            log().debug(
                "{}:{}: Expected at least {} fields, got {}.",
                stats.name_,
                reader.line(),
                header.size(),
                row.size());
            ++stats.malformedRows_;
            continue;
        }

        RawFeatureRecord record;
        record.line_ = reader.line();
        for (size_t i = 0; i < header.size(); ++i)
            record.columns_.emplace(header[i], trim(row[i]));
        record.segmentId_ = record.column(descriptor.idColumn_).value_or("");
        record.geometry_ = record.column(descriptor.geometryColumn_).value_or("");
        addRecord(descriptor, record, stats);
    }

    log().info(
        "Dataset {}: {} rows, {} merged, {} malformed, {} without geometry, {} segments.",
        stats.name_,
        stats.rowsRead_,
        stats.rowsMerged_,
        stats.malformedRows_,
        stats.geometryErrors_,
        stats.segmentIds_.size());
    return stats;
}

bool Aggregator::addRecord(DatasetDescriptor const& descriptor, RawFeatureRecord const& record)
{
    auto stats = std::find_if(
        statistics_.begin(),
        statistics_.end(),
        [&](auto const& s) { return s.name_ == descriptor.name(); });
    if (stats == statistics_.end())
        return addRecord(descriptor, record, newStatistics(descriptor));
    return addRecord(descriptor, record, *stats);
}

bool Aggregator::addRecord(
    DatasetDescriptor const& descriptor,
    RawFeatureRecord const& record,
    DatasetStatistics& stats)
{
    if (record.segmentId_.empty()) {
        log().debug("{}:{}: Row has no segment id.", stats.name_, record.line_);
        ++stats.malformedRows_;
        return false;
    }

    auto geometry = parser_->parse(record.geometry_);
    if (!geometry) {
        log().debug("{}:{}: Unusable geometry for segment {}.", stats.name_, record.line_, record.segmentId_);
        ++stats.geometryErrors_;
        return false;
    }

    auto& segment = store_.upsert(record.segmentId_);
    // A degenerate geometry is replaced by the first usable one.
    if (segment.geometry_.empty() || (!segment.geometry_.bbox() && geometry->bbox()))
        segment.geometry_ = std::move(*geometry);
    else if (!(segment.geometry_ == *geometry)) {
        log().trace("{}:{}: Keeping first geometry of segment {}.", stats.name_, record.line_, record.segmentId_);
        ++stats.geometryConflicts_;
    }

    auto incoming = descriptor.extract(record);
    auto& fields = segment.services_[descriptor.category()];
    for (auto field : AllFields) {
        auto value = fields.get(field);
        mergeField(field, value, incoming.get(field));
        fields.set(field, std::move(value));
    }

    stats.segmentIds_.insert(record.segmentId_);
    ++stats.rowsMerged_;
    return true;
}

std::vector<DatasetStatistics> const& Aggregator::statistics() const
{
    return statistics_;
}

nlohmann::json Aggregator::report() const
{
    auto datasets = nlohmann::json::array();
    for (auto const& stats : statistics_)
        datasets.push_back(stats.toJson());

    // Segments which occur in every dataset that was actually read.
    size_t inAllDatasets = 0;
    for (auto const& [id, segment] : store_) {
        bool everywhere = true;
        for (auto const& stats : statistics_) {
            if (!stats.missing_ && !stats.segmentIds_.contains(id)) {
                everywhere = false;
                break;
            }
        }
        if (everywhere)
            ++inAllDatasets;
    }

    auto coverage = store_.coverage();
    coverage["in-all-datasets"] = inAllDatasets;
    return nlohmann::json::object({{"datasets", datasets}, {"coverage", coverage}});
}

CanonicalStore Aggregator::finish()
{
    if (store_.empty())
        raise<FatalStartupError>("Aggregation produced no segments: All datasets are missing or unusable.");
    log().info("Aggregated {} segments from {} datasets.", store_.size(), statistics_.size());
    auto result = std::move(store_);
    store_ = CanonicalStore();
    statistics_.clear();
    return result;
}

}

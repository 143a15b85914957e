#pragma once

#include "infraget/model/segment.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace infraget
{

/**
 * One row of one dataset. Column values are trimmed.
 * Transient: consumed and discarded during aggregation.
 */
struct RawFeatureRecord
{
    size_t line_ = 0;
    std::string segmentId_;
    std::string geometry_;
    std::unordered_map<std::string, std::string> columns_;

    /** Value of a column, or nullopt if the dataset has no such column. */
    [[nodiscard]] std::optional<std::string> column(std::string const& name) const;
};

using ColumnMapping = std::map<Field, std::string>;

/*
 * Dataset kinds. Each kind names the service category it feeds and
 * the default columns from which the category's fields are extracted.
 */

struct LightingDataset
{
    static constexpr auto category = ServiceCategory::Lighting;
    static ColumnMapping columns() { return {{Field::Indicator, "IND_IP"}}; }
};

struct CurbDataset
{
    static constexpr auto category = ServiceCategory::Curb;
    static ColumnMapping columns()
    {
        return {{Field::Indicator, "IND_MF"}, {Field::Type, "TP_MF"}, {Field::Date, "DATA"}};
    }
};

struct PavingDataset
{
    static constexpr auto category = ServiceCategory::Paving;
    static ColumnMapping columns()
    {
        return {{Field::Indicator, "IND_PAV"}, {Field::Type, "TP_PAV"}, {Field::Date, "DATA"}};
    }
};

struct WaterDataset
{
    static constexpr auto category = ServiceCategory::Water;
    static ColumnMapping columns() { return {{Field::Indicator, "IND_RDAGU"}, {Field::Date, "DATA"}}; }
};

struct SewageDataset
{
    static constexpr auto category = ServiceCategory::Sewage;
    static ColumnMapping columns() { return {{Field::Indicator, "IND_RDESG"}, {Field::Date, "DATA"}}; }
};

struct ElectricityDataset
{
    static constexpr auto category = ServiceCategory::Electricity;
    static ColumnMapping columns() { return {{Field::Indicator, "IND_RE"}, {Field::Date, "DATA"}}; }
};

struct TelephonyDataset
{
    static constexpr auto category = ServiceCategory::Telephony;
    static ColumnMapping columns() { return {{Field::Indicator, "IND_RT"}, {Field::Date, "DATA"}}; }
};

struct SelectiveCollectionDataset
{
    static constexpr auto category = ServiceCategory::SelectiveCollection;
    static ColumnMapping columns()
    {
        return {
            {Field::Schedule, "PROGRAMACAO"},
            {Field::Shift, "TURNO"},
            {Field::District, "DISTRITO"},
            {Field::ResponsibleParty, "COOPERATIVA"}};
    }
};

using DatasetKind = std::variant<
    LightingDataset,
    CurbDataset,
    PavingDataset,
    WaterDataset,
    SewageDataset,
    ElectricityDataset,
    TelephonyDataset,
    SelectiveCollectionDataset>;

/** Dataset kind which feeds the given category. */
DatasetKind datasetKindFor(ServiceCategory category);

/**
 * Describes one input dataset: its kind (and thus its category and
 * field extraction mapping), where to read it from, and how its rows
 * are laid out. Selected at configuration time.
 */
struct DatasetDescriptor
{
    DatasetKind kind_;
    std::filesystem::path path_;
    char separator_ = ';';
    std::string idColumn_ = "ID_BASE_TRECHO";
    std::string geometryColumn_ = "GEOMETRIA";

    /** Replaces default column names of the dataset kind. */
    ColumnMapping columnOverrides_;

    [[nodiscard]] ServiceCategory category() const;

    /** Effective column mapping: the kind's defaults with overrides applied. */
    [[nodiscard]] ColumnMapping columns() const;

    /** Extract the category's fields from a row. */
    [[nodiscard]] ServiceFields extract(RawFeatureRecord const& record) const;

    /** Name used in log messages and statistics. */
    [[nodiscard]] std::string name() const;
};

}

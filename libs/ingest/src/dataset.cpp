#include "dataset.h"

#include "fmt/format.h"

namespace infraget
{

std::optional<std::string> RawFeatureRecord::column(std::string const& name) const
{
    auto it = columns_.find(name);
    if (it == columns_.end())
        return {};
    return it->second;
}

DatasetKind datasetKindFor(ServiceCategory category)
{
    switch (category) {
    case ServiceCategory::Lighting: return LightingDataset{};
    case ServiceCategory::Curb: return CurbDataset{};
    case ServiceCategory::Paving: return PavingDataset{};
    case ServiceCategory::Water: return WaterDataset{};
    case ServiceCategory::Sewage: return SewageDataset{};
    case ServiceCategory::Electricity: return ElectricityDataset{};
    case ServiceCategory::Telephony: return TelephonyDataset{};
    case ServiceCategory::SelectiveCollection: return SelectiveCollectionDataset{};
    }
    return LightingDataset{};
}

ServiceCategory DatasetDescriptor::category() const
{
    return std::visit([](auto const& kind) { return std::decay_t<decltype(kind)>::category; }, kind_);
}

ColumnMapping DatasetDescriptor::columns() const
{
    auto result = std::visit([](auto const& kind) { return std::decay_t<decltype(kind)>::columns(); }, kind_);
    for (auto const& [field, column] : columnOverrides_)
        result[field] = column;
    return result;
}

ServiceFields DatasetDescriptor::extract(RawFeatureRecord const& record) const
{
    ServiceFields result;
    for (auto const& [field, column] : columns())
        result.set(field, record.column(column));
    return result;
}

std::string DatasetDescriptor::name() const
{
    if (path_.empty())
        return std::string(toString(category()));
    return fmt::format("{} ({})", toString(category()), path_.filename().string());
}

}

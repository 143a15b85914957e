#include "config.h"
#include "infraget/log.h"

#include <nlohmann/json-schema.hpp>
#include <fmt/format.h>

namespace infraget
{

namespace
{

nlohmann::json categoryNames()
{
    auto result = nlohmann::json::array();
    for (auto category : AllServiceCategories)
        result.push_back(std::string(toString(category)));
    return result;
}

nlohmann::json distanceSchema(std::string const& title)
{
    return {{"type", "number"}, {"minimum", 0}, {"title", title}};
}

nlohmann::json datasetSchema()
{
    auto columnProperties = nlohmann::json::object();
    for (auto field : AllFields)
        columnProperties[std::string(toString(field))] = {{"type", "string"}, {"minLength", 1}};

    return {
        {"type", "object"},
        {"properties", {
            {"type", {{"type", "string"}, {"enum", categoryNames()}}},
            {"file", {{"type", "string"}, {"minLength", 1}}},
            {"separator", {{"type", "string"}, {"minLength", 1}, {"maxLength", 1}}},
            {"id-column", {{"type", "string"}, {"minLength", 1}}},
            {"geometry-column", {{"type", "string"}, {"minLength", 1}}},
            {"columns", {
                {"type", "object"},
                {"properties", columnProperties},
                {"additionalProperties", false}
            }},
            {"enabled", {{"type", "boolean"}}}
        }},
        {"required", nlohmann::json::array({"type", "file"})},
        {"additionalProperties", false}
    };
}

nlohmann::json_schema::json_validator& validator()
{
    static nlohmann::json_schema::json_validator instance(configSchema());
    return instance;
}

DatasetDescriptor parseDataset(nlohmann::json const& node, std::filesystem::path const& dataDir)
{
    auto category = serviceCategoryFromString(node["type"].get<std::string>());
    if (!category)
        raiseFmt<std::invalid_argument>("Unknown dataset type: {}", node["type"].dump());

    DatasetDescriptor result{datasetKindFor(*category)};
    result.path_ = node["file"].get<std::string>();
    if (result.path_.is_relative() && !dataDir.empty())
        result.path_ = dataDir / result.path_;
    if (node.contains("separator"))
        result.separator_ = node["separator"].get<std::string>().front();
    if (node.contains("id-column"))
        result.idColumn_ = node["id-column"].get<std::string>();
    if (node.contains("geometry-column"))
        result.geometryColumn_ = node["geometry-column"].get<std::string>();
    if (node.contains("columns")) {
        for (auto const& [fieldName, column] : node["columns"].items()) {
            if (auto field = fieldFromString(fieldName))
                result.columnOverrides_[*field] = column.get<std::string>();
        }
    }
    return result;
}

}

nlohmann::json configSchema()
{
    auto thresholdNames = categoryNames();
    thresholdNames.push_back("default");

    return {
        {"type", "object"},
        {"properties", {
            {"infraget", {{"type", "object"}, {"title", "Command line options"}}},
            {"datasets", {{"type", "array"}, {"title", "Datasets"}, {"items", datasetSchema()}}},
            {"resolver", {
                {"type", "object"},
                {"properties", {
                    {"initial-radius", {{"type", "number"}, {"exclusiveMinimum", 0}}},
                    {"max-radius", {{"type", "number"}, {"exclusiveMinimum", 0}}},
                    {"target-candidates", {{"type", "integer"}, {"minimum", 1}}}
                }},
                {"additionalProperties", false}
            }},
            {"thresholds", {
                {"type", "object"},
                {"title", "Maximum match distance per category"},
                {"propertyNames", {{"enum", thresholdNames}}},
                {"additionalProperties", distanceSchema("Distance")}
            }}
        }},
        {"additionalProperties", false}
    };
}

void validateConfig(nlohmann::json const& config)
{
    try {
        auto _ = validator().validate(config);
    }
    catch (std::invalid_argument const& e) {
        raiseFmt<std::invalid_argument>("Invalid config: {}", e.what());
    }
}

InfraConfig parseConfig(YAML::Node const& yaml, std::filesystem::path const& dataDir)
{
    auto json = yaml.IsNull() ? nlohmann::json::object() : yamlToJson(yaml);
    validateConfig(json);

    InfraConfig result;
    if (json.contains("datasets")) {
        for (auto const& node : json["datasets"]) {
            if (node.value("enabled", true))
                result.datasets_.push_back(parseDataset(node, dataDir));
            else
                log().debug("Dataset {} is disabled.", node["file"].get<std::string>());
        }
    }
    else
        result.datasets_ = defaultDatasets(dataDir);

    if (json.contains("resolver")) {
        auto const& resolver = json["resolver"];
        auto& params = result.service_.resolver_;
        params.initialRadius_ = resolver.value("initial-radius", params.initialRadius_);
        params.maxRadius_ = resolver.value("max-radius", params.maxRadius_);
        params.targetCandidates_ = resolver.value("target-candidates", params.targetCandidates_);
        if (params.maxRadius_ < params.initialRadius_)
            raiseFmt<std::invalid_argument>(
                "Invalid config: max-radius ({}) is smaller than initial-radius ({}).",
                params.maxRadius_,
                params.initialRadius_);
    }

    if (json.contains("thresholds")) {
        for (auto const& [key, value] : json["thresholds"].items()) {
            if (key == "default")
                result.service_.defaultThreshold_ = value.get<double>();
            else if (auto category = serviceCategoryFromString(key))
                result.service_.thresholds_[*category] = value.get<double>();
        }
    }

    return result;
}

InfraConfig loadConfig(std::filesystem::path const& path, std::optional<std::filesystem::path> const& dataDir)
{
    log().debug("Loading config {}.", path.string());
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path.string());
    }
    catch (YAML::Exception const& e) {
        raiseFmt("Failed to parse YAML config {}: {}", path.string(), e.what());
    }
    return parseConfig(yaml, dataDir ? *dataDir : path.parent_path());
}

std::vector<DatasetDescriptor> defaultDatasets(std::filesystem::path const& dataDir)
{
    auto make = [&](DatasetKind kind, char const* file)
    {
        DatasetDescriptor result{std::move(kind)};
        result.path_ = dataDir / file;
        return result;
    };
    return {
        make(LightingDataset{}, "trecho_ilum_publica.csv"),
        make(CurbDataset{}, "trecho_meio_fio.csv"),
        make(PavingDataset{}, "trecho_pavimentacao.csv"),
        make(WaterDataset{}, "trecho_rede_agua.csv"),
        make(SewageDataset{}, "trecho_rede_esgoto.csv"),
        make(ElectricityDataset{}, "trecho_rede_eletrica.csv"),
        make(TelephonyDataset{}, "trecho_rede_telefonica.csv"),
        make(SelectiveCollectionDataset{}, "trecho_coleta_seletiva.csv"),
    };
}

nlohmann::json yamlToJson(YAML::Node const& yamlNode)
{
    if (yamlNode.IsScalar()) {
        // Quoted scalars carry the non-specific tag and stay strings.
        if (yamlNode.Tag() == "!")
            return yamlNode.as<std::string>();
        bool boolValue;
        if (YAML::convert<bool>::decode(yamlNode, boolValue))
            return boolValue;
        int64_t intValue;
        if (YAML::convert<int64_t>::decode(yamlNode, intValue))
            return intValue;
        double doubleValue;
        if (YAML::convert<double>::decode(yamlNode, doubleValue))
            return doubleValue;
        return yamlNode.as<std::string>();
    }

    if (yamlNode.IsSequence()) {
        nlohmann::json arrayJson = nlohmann::json::array();
        for (const auto& elem : yamlNode)
            arrayJson.push_back(yamlToJson(elem));
        return arrayJson;
    }

    if (yamlNode.IsMap()) {
        auto objectJson = nlohmann::json::object();
        for (const auto& item : yamlNode)
            objectJson[item.first.as<std::string>()] = yamlToJson(item.second);
        return objectJson;
    }

    if (yamlNode.IsNull())
        return nullptr;

    log().warn("Could not convert {} to JSON!", YAML::Dump(yamlNode));
    return {};
}

}

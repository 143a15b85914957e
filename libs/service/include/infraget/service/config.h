#pragma once

#include "service.h"
#include "infraget/ingest/dataset.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "yaml-cpp/yaml.h"
#include "nlohmann/json.hpp"

namespace infraget
{

/**
 * Contents of an infraget YAML config file. Top-level keys:
 * - `infraget`: Command line options, consumed by the CLI.
 * - `datasets`: List of dataset descriptors, each with a `type` (category
 *   name) and a `file`, optionally `separator`, `id-column`, `geometry-column`,
 *   `columns` (field name to column name) and `enabled`.
 * - `resolver`: `initial-radius`, `max-radius`, `target-candidates`.
 * - `thresholds`: `default` and per-category match distances.
 */
struct InfraConfig
{
    std::vector<DatasetDescriptor> datasets_;
    ServiceConfig service_;
};

/** JSON schema which the (JSON-converted) config must satisfy. */
[[nodiscard]] nlohmann::json configSchema();

/**
 * Validate a config against configSchema().
 * Raises std::invalid_argument if it is not valid.
 */
void validateConfig(nlohmann::json const& config);

/**
 * Validate and parse a config. Relative dataset paths are
 * resolved against dataDir. If the config has no `datasets` key,
 * the default datasets in dataDir are used.
 */
[[nodiscard]] InfraConfig parseConfig(YAML::Node const& yaml, std::filesystem::path const& dataDir = {});

/**
 * Load a config file. Relative dataset paths are resolved against the
 * dataDir if given, or else against the directory of the config file.
 */
[[nodiscard]] InfraConfig loadConfig(
    std::filesystem::path const& path,
    std::optional<std::filesystem::path> const& dataDir = {});

/** One descriptor per category, with the default file names in dataDir. */
[[nodiscard]] std::vector<DatasetDescriptor> defaultDatasets(std::filesystem::path const& dataDir);

/** Convert YAML to JSON. Scalars become booleans or numbers where possible. */
nlohmann::json yamlToJson(YAML::Node const& yamlNode);

}

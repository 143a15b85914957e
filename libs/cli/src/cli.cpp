#include "cli.h"
#include "infraget/log.h"

#include "infraget/ingest/aggregator.h"
#include "infraget/service/config.h"
#include "infraget/service/service.h"
#include "infraget/service/sqlitestore.h"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <ctime>
#include <string>
#include <vector>
#include <fmt/chrono.h>
#include <yaml-cpp/yaml.h>

namespace infraget
{

namespace
{

class ConfigYAML : public CLI::ConfigBase
{
public:
    std::vector<CLI::ConfigItem> from_config(std::istream& input) const override
    {
        try {
            YAML::Node root = YAML::Load(input);
            YAML::Node infragetNode = root["infraget"];
            return infragetNode ? fromYaml(infragetNode) : std::vector<CLI::ConfigItem>();
        }
        catch (YAML::ParserException const& e) {
            raise(fmt::format("Failed to parse config file! Error: {}", e.what()));
        }
    }

    [[nodiscard]] std::vector<CLI::ConfigItem> fromYaml(
        const YAML::Node& node,
        const std::string& name = "",
        const std::vector<std::string>& prefix = {}) const
    {
        std::vector<CLI::ConfigItem> results;

        if (node.IsMap()) {
            for (const auto& item : node) {
                auto copy_prefix = prefix;
                if (!name.empty()) {
                    copy_prefix.push_back(name);
                }
                auto sub_results = fromYaml(item.second, item.first.as<std::string>(), copy_prefix);
                results.insert(results.end(), sub_results.begin(), sub_results.end());
            }
        }
        else if (!name.empty()) {
            CLI::ConfigItem& res = results.emplace_back();
            res.name = name;
            res.parents = prefix;
            if (node.IsScalar()) {
                res.inputs = {node.as<std::string>()};
            }
            else if (node.IsSequence()) {
                for (const auto& val : node) {
                    res.inputs.push_back(val.as<std::string>());
                }
            }
        }

        return results;
    }
};

std::vector<std::string> categoryNames()
{
    std::vector<std::string> result;
    for (auto category : AllServiceCategories)
        result.emplace_back(toString(category));
    return result;
}

/** Config from the --config file, or the defaults if there is none. */
InfraConfig loadInfraConfig(CLI::App const& app, std::optional<std::filesystem::path> const& dataDir)
{
    auto configOption = app.get_config_ptr();
    if (configOption && *configOption)
        return loadConfig(configOption->as<std::string>(), dataDir);

    InfraConfig result;
    result.datasets_ = defaultDatasets(dataDir.value_or(std::filesystem::current_path()));
    return result;
}

}

struct IngestCommand
{
    std::string store_;
    std::string dataDir_;
    CLI::App& app_;
    std::ostream& out_;

    IngestCommand(CLI::App& app, std::ostream& out) : app_(app), out_(out)
    {
        auto ingestCmd = app.add_subcommand("ingest", "Aggregates the configured datasets into a store.");
        ingestCmd->add_option("-s,--store", store_, "Path of the SQLite store to (re-)create.")
            ->required();
        ingestCmd->add_option(
            "-d,--data-dir",
            dataDir_,
            "Directory against which relative dataset paths are resolved. "
            "Defaults to the directory of the config file.");
        ingestCmd->callback([this]() { ingest(); });
    }

    void ingest()
    {
        std::optional<std::filesystem::path> dataDir;
        if (!dataDir_.empty())
            dataDir = dataDir_;
        auto config = loadInfraConfig(app_, dataDir);
        if (config.datasets_.empty())
            raise<FatalStartupError>("No datasets are configured.");

        Aggregator aggregator;
        for (auto const& dataset : config.datasets_)
            aggregator.addDataset(dataset);
        auto report = aggregator.report();
        auto store = aggregator.finish();

        SQLiteStore db(store_, SQLiteStore::Mode::Recreate);
        db.write(store);
        db.setMeta(
            "generated_at",
            fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(std::time(nullptr))));
        db.setMeta("source", "csv");
        db.setMeta("report", report.dump());

        out_ << report.dump(2) << std::endl;
    }
};

struct QueryCommand
{
    std::string store_;
    double x_ = 0.;
    double y_ = 0.;
    std::vector<std::string> categories_;
    CLI::App& app_;
    std::ostream& out_;

    QueryCommand(CLI::App& app, std::ostream& out) : app_(app), out_(out)
    {
        auto queryCmd = app.add_subcommand("query", "Looks up the available services at a point.");
        queryCmd->add_option("-s,--store", store_, "Path of the SQLite store.")->required();
        queryCmd->add_option("-x", x_, "X coordinate in the planar reference system of the store.")->required();
        queryCmd->add_option("-y", y_, "Y coordinate in the planar reference system of the store.")->required();
        queryCmd->add_option(
            "-c,--category",
            categories_,
            "Service category to look up. Can be specified multiple times. Default: all.")
            ->check(CLI::IsMember(categoryNames()));
        queryCmd->callback([this]() { query(); });
    }

    void query()
    {
        auto config = loadInfraConfig(app_, {});
        if (!categories_.empty()) {
            config.service_.categories_.clear();
            for (auto const& name : categories_)
                config.service_.categories_.push_back(*serviceCategoryFromString(name));
        }

        auto store = SQLiteStore(store_, SQLiteStore::Mode::Read).read();
        if (store.empty())
            raiseFmt<FatalStartupError>("The store {} contains no segments.", store_);

        InfraService service(Snapshot::create(std::move(store)), config.service_);
        out_ << service.lookup({x_, y_}).toJson().dump(2) << std::endl;
    }
};

struct StatsCommand
{
    std::string store_;
    std::ostream& out_;

    StatsCommand(CLI::App& app, std::ostream& out) : out_(out)
    {
        auto statsCmd = app.add_subcommand("stats", "Prints the coverage of a store.");
        statsCmd->add_option("-s,--store", store_, "Path of the SQLite store.")->required();
        statsCmd->callback([this]() { stats(); });
    }

    void stats()
    {
        SQLiteStore db(store_, SQLiteStore::Mode::Read);
        auto meta = nlohmann::json::object();
        for (auto const& [key, value] : db.meta())
            meta[key] = value;
        auto result = nlohmann::json::object({
            {"meta", meta},
            {"coverage", db.read().coverage()}});
        out_ << result.dump(2) << std::endl;
    }
};

int runFromCommandLine(std::vector<std::string> args, bool requireSubcommand, std::ostream& out)
{
    CLI::App app{"Looks up the urban infrastructure services available near a location."};
    std::string log_level_;

    app.add_option(
        "--log-level",
        log_level_,
        "From [trace|debug|info|warn|error|critical], overrides INFRAGET_LOG_LEVEL.")
        ->default_val("");
    app.set_config(
        "--config",
        "",
        "Optional path to a YAML file with datasets, resolver and threshold settings, "
        "and command line arguments for infraget.");
    app.config_formatter(std::make_shared<ConfigYAML>());
    app.parse_complete_callback([&log_level_]() {
        if (!log_level_.empty())
            infraget::setLogLevel(log_level_, log());
    });

    if (requireSubcommand)
        app.require_subcommand(1);

    IngestCommand ingestCommand(app, out);
    QueryCommand queryCommand(app, out);
    StatsCommand statsCommand(app, out);

    try {
        std::reverse(args.begin(), args.end());
        app.parse(std::move(args));
    }
    catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    catch (std::exception const& e) {
        log().error("Command failed: {}", e.what());
        return 1;
    }
    return 0;
}

}

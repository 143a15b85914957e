#pragma once

#include "infraget/model/store.h"

#include <sqlite3.h>
#include <filesystem>
#include <map>
#include <string>

namespace infraget
{

/**
 * SQLite persistence of a canonical store. The database holds the tables
 *  - segments(id, geometry_wkt),
 *  - segment_services(segment_id, category, indicator, type, date,
 *    schedule, shift, district, responsible_party), where NULL
 *    encodes an absent field,
 *  - meta(k, v) with information about the ingestion run.
 */
class SQLiteStore
{
public:
    enum class Mode {
        /** Open an existing database. */
        Read,
        /** Delete any existing database and create a new one. */
        Recreate
    };

    SQLiteStore(std::filesystem::path path, Mode mode);
    ~SQLiteStore();

    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    /** Write all segments of the store in one transaction. */
    void write(CanonicalStore const& store);

    /** Read all segments. Geometries which cannot be parsed are left empty. */
    [[nodiscard]] CanonicalStore read() const;

    void setMeta(std::string const& key, std::string const& value);
    [[nodiscard]] std::map<std::string, std::string> meta() const;

    [[nodiscard]] std::filesystem::path const& path() const;

private:
    void initDatabase();
    void executeSQL(const std::string& sql) const;
    sqlite3_stmt* prepare(const char* sql) const;

    sqlite3* db_{nullptr};
    std::filesystem::path dbPath_;
};

}

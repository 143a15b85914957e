#include "sqlitestore.h"
#include "infraget/ingest/geometryparser.h"
#include "infraget/log.h"

#include <array>
#include <optional>

namespace infraget
{

namespace
{
/** Owns a prepared statement. */
struct Statement
{
    sqlite3_stmt* stmt_;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(Statement const&) = delete;
    Statement& operator=(Statement const&) = delete;
};

void bindOptional(sqlite3_stmt* stmt, int index, std::optional<std::string> const& value)
{
    if (value)
        sqlite3_bind_text(stmt, index, value->c_str(), static_cast<int>(value->size()), SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, index);
}

std::optional<std::string> columnOptional(sqlite3_stmt* stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
        return {};
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
    return std::string(text ? text : "", sqlite3_column_bytes(stmt, index));
}

// Column order of the per-field columns in segment_services.
constexpr std::array<Field, FieldCount> ServiceColumns = {
    Field::Indicator,
    Field::Type,
    Field::Date,
    Field::Schedule,
    Field::Shift,
    Field::District,
    Field::ResponsibleParty};
}

SQLiteStore::SQLiteStore(std::filesystem::path path, Mode mode) : dbPath_(std::move(path))
{
    namespace fs = std::filesystem;

    if (dbPath_.is_relative())
        dbPath_ = fs::current_path() / dbPath_;
    log().debug("Opening SQLite store at: {}", dbPath_.string());

    if (mode == Mode::Read && !fs::exists(dbPath_))
        raiseFmt("SQLite store {} does not exist.", dbPath_.string());

    if (mode == Mode::Recreate) {
        if (!fs::exists(dbPath_.parent_path()))
            raiseFmt("Error creating SQLite store: parent directory {} does not exist!",
                dbPath_.parent_path().string());
        for (auto const& suffix : {"", "-wal", "-shm"}) {
            auto file = fs::path(dbPath_.string() + suffix);
            if (fs::exists(file))
                fs::remove(file);
        }
    }

    int rc = sqlite3_open_v2(
        dbPath_.string().c_str(),
        &db_,
        mode == Mode::Read ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
        nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        raiseFmt("Error opening SQLite database at {}: {}", dbPath_.string(), error);
    }

    if (mode == Mode::Recreate) {
        executeSQL("PRAGMA journal_mode=WAL");
        executeSQL("PRAGMA synchronous=NORMAL");
        initDatabase();
    }
}

SQLiteStore::~SQLiteStore()
{
    if (db_)
        sqlite3_close(db_);
}

void SQLiteStore::initDatabase()
{
    executeSQL(R"(
        CREATE TABLE IF NOT EXISTS segments (
            id TEXT PRIMARY KEY,
            geometry_wkt TEXT NOT NULL
        )
    )");

    executeSQL(R"(
        CREATE TABLE IF NOT EXISTS segment_services (
            segment_id TEXT NOT NULL REFERENCES segments(id),
            category TEXT NOT NULL,
            indicator TEXT,
            type TEXT,
            date TEXT,
            schedule TEXT,
            shift TEXT,
            district TEXT,
            responsible_party TEXT,
            PRIMARY KEY (segment_id, category)
        )
    )");

    executeSQL("CREATE TABLE IF NOT EXISTS meta (k TEXT PRIMARY KEY, v TEXT)");
}

void SQLiteStore::executeSQL(const std::string& sql) const
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        raiseFmt("SQLite error executing '{}': {}", sql, error);
    }
}

sqlite3_stmt* SQLiteStore::prepare(const char* sql) const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        raiseFmt("Failed to prepare statement '{}': {}", sql, sqlite3_errmsg(db_));
    return stmt;
}

void SQLiteStore::write(CanonicalStore const& store)
{
    executeSQL("BEGIN TRANSACTION");
    try {
        Statement putSegment(prepare("INSERT OR REPLACE INTO segments (id, geometry_wkt) VALUES (?, ?)"));
        Statement putService(prepare(
            "INSERT OR REPLACE INTO segment_services "
            "(segment_id, category, indicator, type, date, schedule, shift, district, responsible_party) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"));

        for (auto const& [id, segment] : store) {
            auto wkt = segment.geometry_.toWkt();
            sqlite3_reset(putSegment.stmt_);
            sqlite3_bind_text(putSegment.stmt_, 1, id.c_str(), static_cast<int>(id.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(putSegment.stmt_, 2, wkt.c_str(), static_cast<int>(wkt.size()), SQLITE_TRANSIENT);
            if (sqlite3_step(putSegment.stmt_) != SQLITE_DONE)
                raiseFmt("Error writing segment {}: {}", id, sqlite3_errmsg(db_));

            for (auto const& [category, fields] : segment.services_) {
                auto categoryName = std::string(toString(category));
                sqlite3_reset(putService.stmt_);
                sqlite3_bind_text(putService.stmt_, 1, id.c_str(), static_cast<int>(id.size()), SQLITE_TRANSIENT);
                sqlite3_bind_text(putService.stmt_, 2, categoryName.c_str(), -1, SQLITE_TRANSIENT);
                for (size_t i = 0; i < ServiceColumns.size(); ++i)
                    bindOptional(putService.stmt_, static_cast<int>(i) + 3, fields.get(ServiceColumns[i]));
                if (sqlite3_step(putService.stmt_) != SQLITE_DONE)
                    raiseFmt("Error writing {} fields of segment {}: {}", categoryName, id, sqlite3_errmsg(db_));
            }
        }
    }
    catch (std::exception const&) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
    executeSQL("COMMIT");
    log().info("Wrote {} segments to {}.", store.size(), dbPath_.string());
}

CanonicalStore SQLiteStore::read() const
{
    CanonicalStore result;
    WktGeometryParser parser;
    size_t unparsable = 0;

    Statement getSegments(prepare("SELECT id, geometry_wkt FROM segments"));
    int rc;
    while ((rc = sqlite3_step(getSegments.stmt_)) == SQLITE_ROW) {
        auto id = columnOptional(getSegments.stmt_, 0).value_or("");
        auto& segment = result.upsert(id);
        auto wkt = columnOptional(getSegments.stmt_, 1).value_or("");
        if (auto geometry = parser.parse(wkt))
            segment.geometry_ = std::move(*geometry);
        else
            ++unparsable;
    }
    if (rc != SQLITE_DONE)
        raiseFmt("Error reading segments: {}", sqlite3_errmsg(db_));

    Statement getServices(prepare(
        "SELECT segment_id, category, indicator, type, date, schedule, shift, district, responsible_party "
        "FROM segment_services"));
    while ((rc = sqlite3_step(getServices.stmt_)) == SQLITE_ROW) {
        auto id = columnOptional(getServices.stmt_, 0).value_or("");
        auto categoryName = columnOptional(getServices.stmt_, 1).value_or("");
        auto category = serviceCategoryFromString(categoryName);
        if (!category) {
            log().warn("Ignoring unknown service category {} of segment {}.", categoryName, id);
            continue;
        }
        auto& fields = result.upsert(id).services_[*category];
        for (size_t i = 0; i < ServiceColumns.size(); ++i)
            fields.set(ServiceColumns[i], columnOptional(getServices.stmt_, static_cast<int>(i) + 2));
    }
    if (rc != SQLITE_DONE)
        raiseFmt("Error reading segment services: {}", sqlite3_errmsg(db_));

    if (unparsable)
        log().debug("{} stored segments have no usable geometry.", unparsable);
    log().info("Loaded {} segments from {}.", result.size(), dbPath_.string());
    return result;
}

void SQLiteStore::setMeta(std::string const& key, std::string const& value)
{
    Statement putMeta(prepare("INSERT OR REPLACE INTO meta (k, v) VALUES (?, ?)"));
    sqlite3_bind_text(putMeta.stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(putMeta.stmt_, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(putMeta.stmt_) != SQLITE_DONE)
        raiseFmt("Error writing meta entry {}: {}", key, sqlite3_errmsg(db_));
}

std::map<std::string, std::string> SQLiteStore::meta() const
{
    std::map<std::string, std::string> result;
    Statement getMeta(prepare("SELECT k, v FROM meta"));
    int rc;
    while ((rc = sqlite3_step(getMeta.stmt_)) == SQLITE_ROW)
        result[columnOptional(getMeta.stmt_, 0).value_or("")] = columnOptional(getMeta.stmt_, 1).value_or("");
    if (rc != SQLITE_DONE)
        raiseFmt("Error reading meta entries: {}", sqlite3_errmsg(db_));
    return result;
}

std::filesystem::path const& SQLiteStore::path() const
{
    return dbPath_;
}

}

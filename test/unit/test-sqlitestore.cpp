#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "infraget/service/sqlitestore.h"
#include "utility.h"

using namespace infraget;
namespace fs = std::filesystem;

TEST_CASE("SQLiteStore", "[SQLiteStore]")
{
    auto tempDir = fs::temp_directory_path() / test::generateTimestampedDirectoryName("infraget_test_sqlite");
    fs::create_directory(tempDir);
    auto dbPath = tempDir / "infra.db";

    CanonicalStore store;
    {
        auto& a = store.upsert("A-1");
        a.geometry_.parts.push_back(LineString{{{333000.25, 7394000.5}, {333010, 7394010}}});
        auto& paving = a.services_[ServiceCategory::Paving];
        paving.set(Field::Indicator, "S");
        paving.set(Field::Type, "");
        paving.set(Field::Date, "01/02/2024");

        auto& b = store.upsert("B-2");
        b.geometry_.parts.push_back(LineString{{{0, 0}, {1, 0}}});
        b.geometry_.parts.push_back(LineString{{{2, 2}, {3, 3}, {4, 3}}});
        auto& collection = b.services_[ServiceCategory::SelectiveCollection];
        collection.set(Field::Schedule, "SEG/QUA/SEX");
        collection.set(Field::ResponsibleParty, "Cooperativa Sul");
        b.services_[ServiceCategory::Lighting];
    }

    SECTION("Round trip")
    {
        {
            SQLiteStore db(dbPath, SQLiteStore::Mode::Recreate);
            db.write(store);
            db.setMeta("source", "csv");
            db.setMeta("source", "test");
        }

        SQLiteStore db(dbPath, SQLiteStore::Mode::Read);
        auto loaded = db.read();
        REQUIRE(loaded.size() == 2);
        REQUIRE(*loaded.find("A-1") == *store.find("A-1"));
        REQUIRE(*loaded.find("B-2") == *store.find("B-2"));
        REQUIRE_FALSE(loaded.find("B-2")->service(ServiceCategory::Lighting)->get(Field::Indicator));
        REQUIRE(loaded.find("A-1")->service(ServiceCategory::Paving)->get(Field::Type) == "");
        REQUIRE(db.meta() == std::map<std::string, std::string>{{"source", "test"}});
    }

    SECTION("Recreate drops previous content")
    {
        {
            SQLiteStore db(dbPath, SQLiteStore::Mode::Recreate);
            db.write(store);
        }
        CanonicalStore small;
        small.insert(test::makeSegment("only", {{0, 0}, {1, 1}}));
        {
            SQLiteStore db(dbPath, SQLiteStore::Mode::Recreate);
            db.write(small);
        }
        auto loaded = SQLiteStore(dbPath, SQLiteStore::Mode::Read).read();
        REQUIRE(loaded.size() == 1);
        REQUIRE(loaded.find("only"));
    }

    SECTION("Read mode does not modify the store")
    {
        {
            SQLiteStore db(dbPath, SQLiteStore::Mode::Recreate);
            db.write(store);
            db.setMeta("source", "csv");
        }
        fs::permissions(
            dbPath,
            fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
            fs::perm_options::remove);

        SQLiteStore db(dbPath, SQLiteStore::Mode::Read);
        REQUIRE(db.read().size() == 2);
        REQUIRE(db.meta().at("source") == "csv");
        REQUIRE_THROWS_AS(db.setMeta("source", "test"), std::runtime_error);
        REQUIRE(db.meta().at("source") == "csv");
    }

    SECTION("Missing database")
    {
        REQUIRE_THROWS_AS(SQLiteStore(tempDir / "missing.db", SQLiteStore::Mode::Read), std::runtime_error);
        REQUIRE_THROWS_AS(SQLiteStore(tempDir / "no" / "such" / "dir.db", SQLiteStore::Mode::Recreate), std::runtime_error);
    }

    fs::remove_all(tempDir);
}

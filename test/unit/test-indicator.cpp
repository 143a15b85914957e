#include <catch2/catch_test_macros.hpp>

#include "infraget/service/indicator.h"
#include "utility.h"

using namespace infraget;

namespace
{

CanonicalSegment segmentWith(ServiceCategory category, std::map<Field, std::string> const& values)
{
    auto result = test::makeSegment("1", {{0, 0}, {1, 0}});
    auto& fields = result.services_[category];
    for (auto const& [field, value] : values)
        fields.set(field, value);
    return result;
}

}

TEST_CASE("Binary indicator mapping", "[Indicator]")
{
    REQUIRE(mapBinaryIndicator("S") == Availability::Available);
    REQUIRE(mapBinaryIndicator("N") == Availability::Unavailable);
    REQUIRE(mapBinaryIndicator("") == Availability::Unknown);
    REQUIRE(mapBinaryIndicator("xyz") == Availability::NotFound);
    REQUIRE(mapBinaryIndicator(std::nullopt) == Availability::NotFound);

    for (auto token : {"sim", " Sim ", "y", "1", "true", "TRUE"})
        REQUIRE(mapBinaryIndicator(token) == Availability::Available);
    for (auto token : {"n", "nao", "NÃO", "não", "0", "False"})
        REQUIRE(mapBinaryIndicator(token) == Availability::Unavailable);
    REQUIRE(mapBinaryIndicator("  \t") == Availability::Unknown);
    REQUIRE(mapBinaryIndicator("SIMM") == Availability::NotFound);
}

TEST_CASE("Indicator semantics per category", "[Indicator]")
{
    SECTION("No matching segment")
    {
        auto result = mapIndicator(ServiceCategory::Paving, nullptr);
        REQUIRE(result.availability_ == Availability::NotFound);
        REQUIRE(result.fields_.size() == 2);
        REQUIRE_FALSE(result.field(Field::Type));
        REQUIRE_FALSE(result.field(Field::Date));
        REQUIRE(result.toJson() == nlohmann::json{{"availability", "not-found"}, {"type", nullptr}, {"date", nullptr}});
    }

    SECTION("Lighting has no pass-through fields")
    {
        auto segment = segmentWith(ServiceCategory::Lighting, {{Field::Indicator, "S"}});
        auto result = mapIndicator(ServiceCategory::Lighting, &segment);
        REQUIRE(result.availability_ == Availability::Available);
        REQUIRE(result.fields_.empty());
        REQUIRE(result.toJson() == nlohmann::json{{"availability", "available"}});
    }

    SECTION("Segment without the category")
    {
        auto segment = segmentWith(ServiceCategory::Lighting, {{Field::Indicator, "S"}});
        auto result = mapIndicator(ServiceCategory::Water, &segment);
        REQUIRE(result.availability_ == Availability::NotFound);
        REQUIRE(result.field(Field::Date) == std::string(NotInformed));
    }

    SECTION("Absent and blank pass-through fields")
    {
        auto segment = segmentWith(ServiceCategory::Curb, {{Field::Indicator, "N"}, {Field::Type, "  "}});
        auto result = mapIndicator(ServiceCategory::Curb, &segment);
        REQUIRE(result.availability_ == Availability::Unavailable);
        REQUIRE(result.field(Field::Type) == std::string(NotInformed));
        REQUIRE(result.field(Field::Date) == std::string(NotInformed));
    }

    SECTION("Water with blank indicator and date")
    {
        auto segment = segmentWith(ServiceCategory::Water, {{Field::Indicator, ""}, {Field::Date, "01/02/2024"}});
        auto result = mapIndicator(ServiceCategory::Water, &segment);
        REQUIRE(result.availability_ == Availability::Unknown);
        REQUIRE(result.field(Field::Date) == "01/02/2024");
        REQUIRE(result.toJson()["date"] == "01/02/2024");
    }

    SECTION("Paving inference from the type")
    {
        auto blank = segmentWith(ServiceCategory::Paving, {{Field::Indicator, ""}, {Field::Type, "ASFALTO"}});
        REQUIRE(mapIndicator(ServiceCategory::Paving, &blank).availability_ == Availability::Available);
        REQUIRE(mapIndicator(ServiceCategory::Paving, &blank).field(Field::Type) == "ASFALTO");

        auto garbled = segmentWith(ServiceCategory::Paving, {{Field::Indicator, "?"}, {Field::Type, "BLOQUETE"}});
        REQUIRE(mapIndicator(ServiceCategory::Paving, &garbled).availability_ == Availability::Available);

        auto absent = segmentWith(ServiceCategory::Paving, {{Field::Type, "ASFALTO"}});
        REQUIRE(mapIndicator(ServiceCategory::Paving, &absent).availability_ == Availability::Available);

        auto negative = segmentWith(ServiceCategory::Paving, {{Field::Indicator, "N"}, {Field::Type, "ASFALTO"}});
        REQUIRE(mapIndicator(ServiceCategory::Paving, &negative).availability_ == Availability::Unavailable);

        auto noType = segmentWith(ServiceCategory::Paving, {{Field::Indicator, "?"}, {Field::Type, " "}});
        REQUIRE(mapIndicator(ServiceCategory::Paving, &noType).availability_ == Availability::NotFound);
    }

    SECTION("Selective collection")
    {
        auto none = segmentWith(ServiceCategory::SelectiveCollection, {{Field::Schedule, "SEM COLETA DOMICILIAR"}, {Field::District, "Centro"}});
        REQUIRE(mapIndicator(ServiceCategory::SelectiveCollection, &none).availability_ == Availability::Unavailable);

        auto lower = segmentWith(ServiceCategory::SelectiveCollection, {{Field::Schedule, "sem coleta"}});
        REQUIRE(mapIndicator(ServiceCategory::SelectiveCollection, &lower).availability_ == Availability::Unavailable);

        auto notApplicable = segmentWith(
            ServiceCategory::SelectiveCollection,
            {{Field::Schedule, "NÃO SE APLICA"}, {Field::Shift, ""}, {Field::District, ""}, {Field::ResponsibleParty, ""}});
        REQUIRE(mapIndicator(ServiceCategory::SelectiveCollection, &notApplicable).availability_ == Availability::NotFound);

        auto tokens = segmentWith(
            ServiceCategory::SelectiveCollection,
            {{Field::Schedule, "n/a"}, {Field::Shift, "NA"}, {Field::District, "nao se aplica"}});
        REQUIRE(mapIndicator(ServiceCategory::SelectiveCollection, &tokens).availability_ == Availability::NotFound);

        auto district = segmentWith(ServiceCategory::SelectiveCollection, {{Field::Schedule, ""}, {Field::District, "Centro"}});
        auto result = mapIndicator(ServiceCategory::SelectiveCollection, &district);
        REQUIRE(result.availability_ == Availability::Available);
        REQUIRE(result.field(Field::District) == "Centro");
        REQUIRE(result.field(Field::Schedule) == std::string(NotInformed));
        REQUIRE(result.field(Field::Shift) == std::string(NotInformed));
        REQUIRE(result.fields_.size() == 4);
    }
}

TEST_CASE("Pass-through field resolution", "[Indicator]")
{
    auto segment = segmentWith(ServiceCategory::Curb, {{Field::Type, " CONCRETO "}});
    REQUIRE_FALSE(resolveField(nullptr, ServiceCategory::Curb, Field::Type));
    REQUIRE(resolveField(&segment, ServiceCategory::Curb, Field::Type) == "CONCRETO");
    REQUIRE(resolveField(&segment, ServiceCategory::Curb, Field::Date) == std::string(NotInformed));
    REQUIRE(resolveField(&segment, ServiceCategory::Water, Field::Date) == std::string(NotInformed));

    REQUIRE(passThroughFields(ServiceCategory::Lighting).empty());
    REQUIRE(passThroughFields(ServiceCategory::Telephony) == std::vector<Field>{Field::Date});
}

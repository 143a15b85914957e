#include "indicator.h"
#include "infraget/ingest/csvreader.h"

#include <algorithm>
#include <array>

namespace infraget
{

namespace
{

/**
 * Upper-case ASCII letters and the Latin-1 supplement lower-case
 * letters of UTF-8 input (e.g. ã -> Ã). Other bytes are kept.
 */
std::string upperCase(std::string_view s)
{
    std::string result(s);
    for (size_t i = 0; i < result.size(); ++i) {
        auto c = static_cast<unsigned char>(result[i]);
        if (c >= 'a' && c <= 'z')
            result[i] = static_cast<char>(c - 'a' + 'A');
        else if (c == 0xC3 && i + 1 < result.size()) {
            auto next = static_cast<unsigned char>(result[i + 1]);
            if (next >= 0xA0 && next <= 0xBE && next != 0xB7)
                result[i + 1] = static_cast<char>(next - 0x20);
            ++i;
        }
    }
    return result;
}

template <size_t N>
bool oneOf(std::string const& token, std::array<std::string_view, N> const& tokens)
{
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

constexpr std::array<std::string_view, 5> AvailableTokens = {"S", "SIM", "Y", "1", "TRUE"};
constexpr std::array<std::string_view, 5> UnavailableTokens = {"N", "NAO", "NÃO", "0", "FALSE"};
constexpr std::array<std::string_view, 4> NotApplicableTokens = {
    "NÃO SE APLICA", "NAO SE APLICA", "N/A", "NA"};

std::string normalizedValue(ServiceFields const* fields, Field field)
{
    if (!fields || !fields->get(field))
        return {};
    return upperCase(trim(*fields->get(field)));
}

bool meaningful(ServiceFields const* fields, Field field)
{
    auto value = normalizedValue(fields, field);
    return !value.empty() && !oneOf(value, NotApplicableTokens);
}

Availability selectiveCollectionAvailability(ServiceFields const* fields)
{
    if (normalizedValue(fields, Field::Schedule).find("SEM COLETA") != std::string::npos)
        return Availability::Unavailable;
    for (auto field : {Field::Schedule, Field::Shift, Field::District, Field::ResponsibleParty})
        if (meaningful(fields, field))
            return Availability::Available;
    return Availability::NotFound;
}

}

std::string_view toString(Availability availability)
{
    switch (availability) {
    case Availability::Available: return "available";
    case Availability::Unavailable: return "unavailable";
    case Availability::Unknown: return "unknown";
    case Availability::NotFound: return "not-found";
    }
    return "not-found";
}

Availability mapBinaryIndicator(std::optional<std::string> const& value)
{
    if (!value)
        return Availability::NotFound;
    auto token = upperCase(trim(*value));
    if (token.empty())
        return Availability::Unknown;
    if (oneOf(token, AvailableTokens))
        return Availability::Available;
    if (oneOf(token, UnavailableTokens))
        return Availability::Unavailable;
    return Availability::NotFound;
}

std::vector<Field> const& passThroughFields(ServiceCategory category)
{
    static const std::vector<Field> none;
    static const std::vector<Field> typeAndDate = {Field::Type, Field::Date};
    static const std::vector<Field> dateOnly = {Field::Date};
    static const std::vector<Field> collection = {
        Field::Schedule, Field::Shift, Field::District, Field::ResponsibleParty};

    switch (category) {
    case ServiceCategory::Lighting: return none;
    case ServiceCategory::Curb:
    case ServiceCategory::Paving: return typeAndDate;
    case ServiceCategory::Water:
    case ServiceCategory::Sewage:
    case ServiceCategory::Electricity:
    case ServiceCategory::Telephony: return dateOnly;
    case ServiceCategory::SelectiveCollection: return collection;
    }
    return none;
}

std::optional<std::string> resolveField(CanonicalSegment const* matched, ServiceCategory category, Field field)
{
    if (!matched)
        return {};
    auto const* fields = matched->service(category);
    if (!fields || !fields->get(field))
        return std::string(NotInformed);
    auto value = trim(*fields->get(field));
    if (value.empty())
        return std::string(NotInformed);
    return value;
}

std::optional<std::string> AvailabilityDescriptor::field(Field f) const
{
    auto it = fields_.find(f);
    if (it == fields_.end())
        return {};
    return it->second;
}

nlohmann::json AvailabilityDescriptor::toJson() const
{
    auto result = nlohmann::json::object({{"availability", std::string(toString(availability_))}});
    for (auto const& [f, value] : fields_) {
        if (value)
            result[std::string(toString(f))] = *value;
        else
            result[std::string(toString(f))] = nullptr;
    }
    return result;
}

AvailabilityDescriptor mapIndicator(ServiceCategory category, CanonicalSegment const* matched)
{
    AvailabilityDescriptor result;
    result.category_ = category;
    for (auto field : passThroughFields(category))
        result.fields_[field] = resolveField(matched, category, field);

    if (!matched)
        return result;

    auto const* fields = matched->service(category);
    if (category == ServiceCategory::SelectiveCollection) {
        result.availability_ = selectiveCollectionAvailability(fields);
        return result;
    }

    result.availability_ = fields ? mapBinaryIndicator(fields->get(Field::Indicator)) : Availability::NotFound;
    if (category == ServiceCategory::Paving &&
        result.availability_ != Availability::Available &&
        result.availability_ != Availability::Unavailable &&
        !normalizedValue(fields, Field::Type).empty()) {
        result.availability_ = Availability::Available;
    }
    return result;
}

}

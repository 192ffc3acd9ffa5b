#include <stdexcept>

#include "nostrcast/data/data.hpp"

using namespace nlohmann;
using namespace nostrcast::data;
using namespace std;

string Filters::serialize(const string& subscriptionId) const
{
    this->validate();

    json j = *this;
    json jarr = json::array({ "REQ", subscriptionId, j });

    return jarr.dump();
};

void Filters::validate() const
{
    bool hasLimit = this->limit >= 0;
    if (!hasLimit)
    {
        throw invalid_argument("Filters::validate: The limit must not be negative.");
    }

    bool hasIds = this->ids.size() > 0;
    bool hasAuthors = this->authors.size() > 0;
    bool hasKinds = this->kinds.size() > 0;
    bool hasTags = this->tags.size() > 0;

    bool hasFilter = hasIds || hasAuthors || hasKinds || hasTags;

    if (!hasFilter)
    {
        throw invalid_argument("Filters::validate: At least one filter must be set.");
    }
};

void adl_serializer<Filters>::to_json(json& j, const Filters& filters)
{
    j = json::object();

    if (!filters.ids.empty())
    {
        j["ids"] = filters.ids;
    }
    if (!filters.authors.empty())
    {
        j["authors"] = filters.authors;
    }
    if (!filters.kinds.empty())
    {
        j["kinds"] = filters.kinds;
    }
    if (filters.since > 0)
    {
        j["since"] = filters.since;
    }
    if (filters.until > 0)
    {
        j["until"] = filters.until;
    }
    if (filters.limit > 0)
    {
        j["limit"] = filters.limit;
    }

    for (auto& tag : filters.tags)
    {
        string name = tag.first[0] == '#'
            ? tag.first
            : '#' + tag.first;

        json values = json::array();
        for (auto& value : tag.second)
        {
            values.push_back(value);
        }

        j[name] = values;
    }
};

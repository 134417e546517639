#include <rcs/member_constraint_json.hh>

#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace rcs;

using std::string;

namespace
{
    auto span_as_json(const Span & span) -> nlohmann::json
    {
        nlohmann::json result;
        result["file"] = span.file;
        result["lo"] = span.lo;
        result["hi"] = span.hi;
        return result;
    }

    auto opaque_type_key_as_json(const OpaqueTypeKey & key) -> nlohmann::json
    {
        nlohmann::json result;
        result["def_index"] = key.def_index;
        result["name"] = key.name;
        return result;
    }
}

template <RegionKey Region_>
auto rcs::member_constraints_as_json(const MemberConstraintSet<Region_> & set) -> string
{
    nlohmann::json constraints = nlohmann::json::array();
    for (auto idx : set.all_indices()) {
        const auto & c = set[idx];

        nlohmann::json choices = nlohmann::json::array();
        for (auto & r : set.choice_regions(idx))
            choices.push_back(r.to_string());

        nlohmann::json data;
        data["index"] = idx.index;
        data["member_region"] = c.member_region_vid.to_string();
        data["choice_regions"] = choices;
        data["definition_span"] = span_as_json(c.definition_span);
        data["hidden_type"] = c.hidden_ty.description;
        data["opaque_type_key"] = opaque_type_key_as_json(c.key);
        constraints.push_back(data);
    }

    nlohmann::json groups = nlohmann::json::array();
    for (const auto & key : set.keys()) {
        nlohmann::json chain = nlohmann::json::array();
        for (auto idx : set.indices(key))
            chain.push_back(idx.index);

        nlohmann::json data;
        data["key"] = fmt::format("{}", key);
        data["chain"] = chain;
        groups.push_back(data);
    }

    nlohmann::json result;
    result["constraints"] = constraints;
    result["groups"] = groups;
    // hidden types and names come from source text, which need not be valid UTF-8
    return result.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

template auto rcs::member_constraints_as_json(const MemberConstraintSet<RegionVid> &) -> string;
template auto rcs::member_constraints_as_json(const MemberConstraintSet<ConstraintSccIndex> &) -> string;

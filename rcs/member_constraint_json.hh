#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_JSON_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_JSON_HH

#include <rcs/member_constraint_set.hh>
#include <rcs/region_vid.hh>

#include <string>

namespace rcs
{
    /**
     * \brief Render a MemberConstraintSet as a JSON document, for debugging.
     *
     * The document has a "constraints" array, in the order the constraints
     * were added, giving each one's index, member region, choice regions and
     * passenger data, and a "groups" array giving each key and the indices
     * on its chain in traversal order.
     *
     * Available for sets keyed by RegionVid and by ConstraintSccIndex.
     *
     * \ingroup Core
     */
    template <RegionKey Region_>
    [[nodiscard]] auto member_constraints_as_json(const MemberConstraintSet<Region_> &) -> std::string;

    extern template auto member_constraints_as_json(const MemberConstraintSet<RegionVid> &) -> std::string;
    extern template auto member_constraints_as_json(const MemberConstraintSet<ConstraintSccIndex> &) -> std::string;
}

#endif

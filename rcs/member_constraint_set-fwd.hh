#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_SET_FWD_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_SET_FWD_HH

#include <rcs/region_vid.hh>

namespace rcs
{
    template <RegionKey Region_>
    class MemberConstraintSet;

    struct MemberConstraintIndex;

    class MemberConstraint;

    struct MemberConstraintSetStats;
}

#endif

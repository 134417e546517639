#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_SET_STATS_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_SET_STATS_HH

#include <iosfwd>

#include <fmt/ostream.h>

namespace rcs
{
    /**
     * \brief Statistics about a MemberConstraintSet.
     *
     * The merge counters accumulate over every MemberConstraintSet::into_mapped()
     * call in the set's history. splice_steps counts the links walked to find
     * the end of a chain while merging, which is the only part of a remap
     * that is not constant time per key.
     *
     * \sa MemberConstraintSet::stats()
     * \ingroup Core
     */
    struct MemberConstraintSetStats final
    {
        unsigned long long n_constraints = 0;
        unsigned long long n_choice_regions = 0;
        unsigned long long n_keys = 0;
        unsigned long long remaps = 0;
        unsigned long long merges = 0;
        unsigned long long splice_steps = 0;
    };

    /**
     * \brief MemberConstraintSetStats can be written to an ostream, for
     * convenience.
     *
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const MemberConstraintSetStats &) -> std::ostream &;
}

template <>
struct fmt::formatter<rcs::MemberConstraintSetStats> : ostream_formatter
{
};

#endif

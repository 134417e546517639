#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_INNARDS_SET_IDENTITY_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_INNARDS_SET_IDENTITY_HH

namespace rcs::innards
{
    /**
     * The identity carried by a set that has been moved from or consumed.
     * No MemberConstraintIndex ever has this as its owner.
     *
     * \ingroup Innards
     */
    inline constexpr unsigned long long retired_set_identity = 0;

    /**
     * Hands out a fresh identity for a new MemberConstraintSet instance.
     * Safe to call from independent inference contexts running in parallel.
     *
     * \ingroup Innards
     */
    [[nodiscard]] auto next_member_constraint_set_identity() -> unsigned long long;
}

#endif

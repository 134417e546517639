#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_HH

#include <rcs/member_constraint_set-fwd.hh>
#include <rcs/opaque_type.hh>
#include <rcs/region_vid.hh>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <utility>

#include <fmt/ostream.h>

namespace rcs
{
    /**
     * \brief Handle to one `R0 member of [R1..Rn]` constraint in a
     * MemberConstraintSet.
     *
     * Handles are dense and are never reused, but they only mean anything to
     * the set instance that handed them out: owner records which one.
     *
     * \ingroup Core
     */
    struct MemberConstraintIndex final
    {
        std::size_t index;
        unsigned long long owner;

        [[nodiscard]] constexpr auto operator<=>(const MemberConstraintIndex &) const = default;
    };

    auto operator<<(std::ostream &, const MemberConstraintIndex &) -> std::ostream &;

    /**
     * \brief Represents a `R0 member of [R1..Rn]` constraint.
     *
     * The passenger fields are never looked at by the set itself, they are
     * kept for error reporting. The choice regions `R1..Rn` live in the
     * owning set, see MemberConstraintSet::choice_regions().
     *
     * \ingroup Core
     */
    class MemberConstraint final
    {
    private:
        template <RegionKey>
        friend class MemberConstraintSet;

        // Position of the next constraint in the same chain, if any.
        std::optional<std::size_t> _next_constraint;

        // [_start_index, _end_index) in the set's choice regions.
        std::size_t _start_index;
        std::size_t _end_index;

        MemberConstraint(std::optional<std::size_t> next, Span span, HiddenType hidden, OpaqueTypeKey opaque_key,
            RegionVid member, std::size_t start, std::size_t end) :
            _next_constraint(next),
            _start_index(start),
            _end_index(end),
            definition_span(std::move(span)),
            hidden_ty(std::move(hidden)),
            key(std::move(opaque_key)),
            member_region_vid(member)
        {
        }

    public:
        /// The span where the hidden type was instantiated.
        Span definition_span;

        /// The hidden type in which `R0` appears.
        HiddenType hidden_ty;

        OpaqueTypeKey key;

        /// The region `R0`, as it was when the constraint was added.
        RegionVid member_region_vid;

        [[nodiscard]] auto number_of_choice_regions() const -> std::size_t
        {
            return _end_index - _start_index;
        }
    };
}

template <>
struct std::hash<rcs::MemberConstraintIndex>
{
    [[nodiscard]] inline auto operator()(const rcs::MemberConstraintIndex & i) const noexcept -> std::size_t
    {
        return hash<std::size_t>{}(i.index) ^ (hash<unsigned long long>{}(i.owner) << 1);
    }
};

template <>
struct fmt::formatter<rcs::MemberConstraintIndex> : ostream_formatter
{
};

#endif

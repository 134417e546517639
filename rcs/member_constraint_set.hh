#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_SET_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_MEMBER_CONSTRAINT_SET_HH

#include <rcs/exception.hh>
#include <rcs/innards/insertion_ordered_map.hh>
#include <rcs/innards/set_identity.hh>
#include <rcs/member_constraint.hh>
#include <rcs/member_constraint_set-fwd.hh>
#include <rcs/member_constraint_set_stats.hh>
#include <rcs/opaque_type.hh>
#include <rcs/region_vid.hh>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
#include <version>

#if __cpp_lib_generator
#include <generator>
#else
#include <__generator.hpp>
#endif

#include <fmt/core.h>

namespace rcs
{
    /**
     * \brief Compactly stores a set of `R0 member of [R1..Rn]` constraints,
     * grouped by the region `R0`.
     *
     * All constraints live in one vector, and all choice regions in another.
     * The constraints for a given key form a singly linked list threaded
     * through the constraint vector by position, with the head map pointing
     * at the most recently added constraint for each key. This means that
     * into_mapped() can regroup everything under new keys by rewriting a few
     * links, without touching the bulk of the data.
     *
     * Constraints can only be added while the set is keyed by RegionVid. After
     * into_mapped() the set is read only.
     *
     * \ingroup Core
     */
    template <RegionKey Region_>
    class MemberConstraintSet
    {
    private:
        template <RegionKey>
        friend class MemberConstraintSet;

        innards::InsertionOrderedMap<Region_, std::size_t> _first_constraints;
        std::vector<MemberConstraint> _constraints;
        std::vector<RegionVid> _choice_regions;
        unsigned long long _identity;

        unsigned long long _remaps = 0;
        unsigned long long _merges = 0;
        unsigned long long _splice_steps = 0;

        MemberConstraintSet(innards::InsertionOrderedMap<Region_, std::size_t> && first_constraints,
            std::vector<MemberConstraint> && constraints, std::vector<RegionVid> && choice_regions,
            unsigned long long remaps, unsigned long long merges, unsigned long long splice_steps) :
            _first_constraints(std::move(first_constraints)),
            _constraints(std::move(constraints)),
            _choice_regions(std::move(choice_regions)),
            _identity(innards::next_member_constraint_set_identity()),
            _remaps(remaps),
            _merges(merges),
            _splice_steps(splice_steps)
        {
        }

        [[nodiscard]] auto position_of(MemberConstraintIndex i) const -> std::size_t
        {
            if (_identity == innards::retired_set_identity)
                throw InvalidConstraintIndex{fmt::format("{} used after its set was consumed", i)};
            if (i.owner != _identity)
                throw InvalidConstraintIndex{fmt::format("{} was not created by this set", i)};
            if (i.index >= _constraints.size())
                throw InvalidConstraintIndex{fmt::format("{} is out of range for {} constraints", i, _constraints.size())};
            return i.index;
        }

        /**
         * Walk the list starting at target_list to its last element, and make
         * that element point at source_list:
         *
         *     target_list: A -> B -> (none)     becomes    A -> B -> C -> D -> (none)
         *     source_list: C -> D -> (none)
         *
         * Returns the number of links followed. There is no tail pointer, so
         * this is linear in the length of target_list, and merging many
         * long chains into one can be quadratic overall.
         */
        static auto append_list(std::vector<MemberConstraint> & constraints, std::size_t target_list, std::size_t source_list) -> unsigned long long
        {
            unsigned long long steps = 0;
            auto p = target_list;
            while (constraints[p]._next_constraint) {
                p = *constraints[p]._next_constraint;
                ++steps;
            }
            constraints[p]._next_constraint = source_list;
            return steps;
        }

        auto check_not_retired(const char * what) const -> void
        {
            if (_identity == innards::retired_set_identity)
                throw ConsumedSetUsed{what};
        }

        auto retire() -> void
        {
            _identity = innards::retired_set_identity;
            _first_constraints = innards::InsertionOrderedMap<Region_, std::size_t>{};
            _constraints.clear();
            _choice_regions.clear();
        }

    public:
        MemberConstraintSet() :
            _identity(innards::next_member_constraint_set_identity())
        {
        }

        ~MemberConstraintSet() = default;

        MemberConstraintSet(const MemberConstraintSet &) = delete;
        auto operator=(const MemberConstraintSet &) -> MemberConstraintSet & = delete;

        MemberConstraintSet(MemberConstraintSet && other) noexcept :
            _first_constraints(std::move(other._first_constraints)),
            _constraints(std::move(other._constraints)),
            _choice_regions(std::move(other._choice_regions)),
            _identity(std::exchange(other._identity, innards::retired_set_identity)),
            _remaps(other._remaps),
            _merges(other._merges),
            _splice_steps(other._splice_steps)
        {
        }

        auto operator=(MemberConstraintSet && other) noexcept -> MemberConstraintSet &
        {
            if (this != &other) {
                _first_constraints = std::move(other._first_constraints);
                _constraints = std::move(other._constraints);
                _choice_regions = std::move(other._choice_regions);
                _identity = std::exchange(other._identity, innards::retired_set_identity);
                _remaps = other._remaps;
                _merges = other._merges;
                _splice_steps = other._splice_steps;
            }
            return *this;
        }

        [[nodiscard]] auto empty() const -> bool
        {
            return _constraints.empty();
        }

        [[nodiscard]] auto size() const -> std::size_t
        {
            return _constraints.size();
        }

        /**
         * Add the constraint `member_region_vid member of [choice_regions...]`.
         * The choice regions are copied exactly as given, including their
         * order and any duplicates. The new constraint becomes the head of
         * member_region_vid's chain.
         */
        auto add_member_constraint(
            OpaqueTypeKey key,
            HiddenType hidden_ty,
            Span definition_span,
            RegionVid member_region_vid,
            std::span<const RegionVid> choice_regions) -> MemberConstraintIndex
            requires std::same_as<Region_, RegionVid>
        {
            check_not_retired("add_member_constraint");

            auto next_constraint = _first_constraints.get(member_region_vid);
            auto start_index = _choice_regions.size();

            // choice_regions might be a view of our own storage, which growing it would invalidate
            auto data = _choice_regions.data();
            if (! choice_regions.empty() && std::less_equal<>{}(data, choice_regions.data()) && std::less<>{}(choice_regions.data(), data + start_index)) {
                auto from = static_cast<std::size_t>(choice_regions.data() - data), n = choice_regions.size();
                _choice_regions.reserve(start_index + n);
                for (std::size_t i = 0; i < n; ++i)
                    _choice_regions.push_back(_choice_regions[from + i]);
            }
            else
                _choice_regions.insert(_choice_regions.end(), choice_regions.begin(), choice_regions.end());

            auto end_index = _choice_regions.size();
            auto position = _constraints.size();
            _constraints.push_back(MemberConstraint{next_constraint, std::move(definition_span), std::move(hidden_ty), std::move(key),
                member_region_vid, start_index, end_index});
            _first_constraints.insert_or_assign(member_region_vid, position);

            return MemberConstraintIndex{position, _identity};
        }

        /**
         * Regroup every constraint under map_fn(old key), consuming this set.
         * The constraint and choice region storage is moved into the result
         * unchanged; only the head map and the end links of colliding chains
         * are rewritten.
         *
         * Old keys are processed in the order they were first added. When an
         * old key maps onto a new key that already has a chain, that earlier
         * chain is appended after the chain being processed, and the chain
         * being processed becomes the head. So if k1, k2 and k3 all map to
         * k, walking k afterwards gives k3's constraints, then k2's, then
         * k1's, each in their original order.
         *
         * Handles from this set are not accepted by the result, and this set
         * can no longer be added to or remapped.
         */
        template <typename MapFn_>
            requires std::invocable<MapFn_ &, const Region_ &> && RegionKey<std::remove_cvref_t<std::invoke_result_t<MapFn_ &, const Region_ &>>>
        [[nodiscard]] auto into_mapped(MapFn_ && map_fn) && -> MemberConstraintSet<std::remove_cvref_t<std::invoke_result_t<MapFn_ &, const Region_ &>>>
        {
            using MappedRegion = std::remove_cvref_t<std::invoke_result_t<MapFn_ &, const Region_ &>>;

            check_not_retired("into_mapped");

            auto first_constraints = std::move(_first_constraints);
            auto constraints = std::move(_constraints);
            auto choice_regions = std::move(_choice_regions);
            auto remaps = _remaps, merges = _merges, splice_steps = _splice_steps;
            retire();

            innards::InsertionOrderedMap<MappedRegion, std::size_t> mapped_first_constraints;
            mapped_first_constraints.reserve(first_constraints.size());

            for (const auto & [r1, start1] : first_constraints) {
                MappedRegion r2 = std::invoke(map_fn, r1);
                if (auto start2 = mapped_first_constraints.get(r2)) {
                    splice_steps += append_list(constraints, start1, *start2);
                    ++merges;
                }
                mapped_first_constraints.insert_or_assign(r2, start1);
            }

            return MemberConstraintSet<MappedRegion>{std::move(mapped_first_constraints), std::move(constraints), std::move(choice_regions),
                remaps + 1, merges, splice_steps};
        }

        /**
         * Every constraint, exactly once, in the order they were added,
         * regardless of key.
         */
        [[nodiscard]] auto all_indices() const -> std::generator<MemberConstraintIndex>
        {
            for (std::size_t p = 0, p_end = _constraints.size(); p != p_end; ++p)
                co_yield MemberConstraintIndex{p, _identity};
        }

        /**
         * The constraints grouped under member_region, most recently added
         * first. Empty if there are none.
         */
        [[nodiscard]] auto indices(Region_ member_region) const -> std::generator<MemberConstraintIndex>
        {
            auto next = _first_constraints.get(member_region);
            while (next) {
                co_yield MemberConstraintIndex{*next, _identity};
                next = _constraints[*next]._next_constraint;
            }
        }

        /**
         * The head of member_region's chain. The caller is asserting that
         * there is at least one constraint for it.
         */
        [[nodiscard]] auto first_constraint(const Region_ & member_region) const -> MemberConstraintIndex
        {
            auto first = _first_constraints.get(member_region);
            if (! first) {
                if constexpr (fmt::is_formattable<Region_>::value)
                    throw UnknownMemberRegion{fmt::format("{}", member_region)};
                else
                    throw UnknownMemberRegion{"a key that cannot be printed"};
            }
            return MemberConstraintIndex{*first, _identity};
        }

        [[nodiscard]] auto contains(const Region_ & member_region) const -> bool
        {
            return _first_constraints.contains(member_region);
        }

        /**
         * Every key with at least one constraint, in the order each was first
         * seen.
         */
        [[nodiscard]] auto keys() const -> std::vector<Region_>
        {
            std::vector<Region_> result;
            result.reserve(_first_constraints.size());
            for (const auto & [r, _] : _first_constraints)
                result.push_back(r);
            return result;
        }

        /**
         * The choice regions `R1..Rn` of a constraint `R0 member of [R1..Rn]`,
         * as a view into the set's storage.
         */
        [[nodiscard]] auto choice_regions(MemberConstraintIndex i) const -> std::span<const RegionVid>
        {
            const auto & c = _constraints[position_of(i)];
            return std::span<const RegionVid>{_choice_regions}.subspan(c._start_index, c._end_index - c._start_index);
        }

        [[nodiscard]] auto operator[](MemberConstraintIndex i) const -> const MemberConstraint &
        {
            return _constraints[position_of(i)];
        }

        [[nodiscard]] auto stats() const -> MemberConstraintSetStats
        {
            MemberConstraintSetStats result;
            result.n_constraints = _constraints.size();
            result.n_choice_regions = _choice_regions.size();
            result.n_keys = _first_constraints.size();
            result.remaps = _remaps;
            result.merges = _merges;
            result.splice_steps = _splice_steps;
            return result;
        }
    };
}

#endif

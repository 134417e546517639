#include <rcs/exception.hh>
#include <rcs/member_constraint_set.hh>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace rcs;

using std::move;
using std::string;
using std::vector;

namespace
{
    auto add(MemberConstraintSet<RegionVid> & set, RegionVid member, const vector<RegionVid> & choices,
        const string & hidden = "T") -> MemberConstraintIndex
    {
        return set.add_member_constraint(OpaqueTypeKey{7, "Opaque"}, HiddenType{hidden}, Span{1, member.index, member.index + 1},
            member, choices);
    }

    template <typename Range_>
    auto positions_of(Range_ && range) -> vector<std::size_t>
    {
        vector<std::size_t> result;
        for (auto idx : range)
            result.push_back(idx.index);
        return result;
    }

    template <typename Region_>
    auto choices_of(const MemberConstraintSet<Region_> & set, MemberConstraintIndex idx) -> vector<RegionVid>
    {
        auto c = set.choice_regions(idx);
        return vector<RegionVid>(c.begin(), c.end());
    }
}

TEST_CASE("Empty set")
{
    MemberConstraintSet<RegionVid> set;
    CHECK(set.empty());
    CHECK(set.size() == 0);
    CHECK(positions_of(set.all_indices()).empty());
    CHECK(positions_of(set.indices(1_vid)).empty());
    CHECK(! set.contains(1_vid));
    CHECK(set.keys().empty());

    auto mapped = move(set).into_mapped([](RegionVid) { return 0_scc; });
    CHECK(mapped.empty());
    CHECK(mapped.keys().empty());
    CHECK(positions_of(mapped.indices(0_scc)).empty());
}

TEST_CASE("All indices are in the order constraints were added")
{
    MemberConstraintSet<RegionVid> set;
    vector<MemberConstraintIndex> added;
    for (auto r : {3_vid, 1_vid, 3_vid, 2_vid, 1_vid, 3_vid})
        added.push_back(add(set, r, {r}));

    CHECK(! set.empty());
    CHECK(set.size() == 6);

    vector<MemberConstraintIndex> all;
    for (auto idx : set.all_indices())
        all.push_back(idx);
    CHECK(all == added);
    CHECK(positions_of(set.all_indices()) == vector<std::size_t>{0, 1, 2, 3, 4, 5});
}

TEST_CASE("Choice regions are kept exactly as given")
{
    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 0_vid, {4_vid, 2_vid, 4_vid, 1_vid});
    auto b = add(set, 0_vid, {});
    auto c = add(set, 5_vid, {9_vid});
    auto d = add(set, 5_vid, {3_vid, 3_vid});

    CHECK(choices_of(set, a) == vector{4_vid, 2_vid, 4_vid, 1_vid});
    CHECK(choices_of(set, b).empty());
    CHECK(choices_of(set, c) == vector{9_vid});
    CHECK(choices_of(set, d) == vector{3_vid, 3_vid});

    CHECK(set[a].number_of_choice_regions() == 4);
    CHECK(set[b].number_of_choice_regions() == 0);
    CHECK(set.stats().n_choice_regions == 7);
}

TEST_CASE("Choice regions can be copied from an existing constraint")
{
    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 0_vid, {4_vid, 2_vid, 8_vid});
    // Enough extra constraints that the storage has to grow
    vector<MemberConstraintIndex> copies;
    for (int i = 0; i < 50; ++i)
        copies.push_back(set.add_member_constraint(OpaqueTypeKey{}, HiddenType{}, Span{}, 1_vid, set.choice_regions(a)));

    for (auto idx : copies)
        CHECK(choices_of(set, idx) == vector{4_vid, 2_vid, 8_vid});
    CHECK(choices_of(set, a) == vector{4_vid, 2_vid, 8_vid});
}

TEST_CASE("Indices for a key are most recent first")
{
    MemberConstraintSet<RegionVid> set;
    auto a1 = add(set, 1_vid, {10_vid});
    auto b1 = add(set, 2_vid, {20_vid});
    auto a2 = add(set, 1_vid, {11_vid});
    auto a3 = add(set, 1_vid, {12_vid});
    auto b2 = add(set, 2_vid, {21_vid});

    CHECK(positions_of(set.indices(1_vid)) == vector{a3.index, a2.index, a1.index});
    CHECK(positions_of(set.indices(2_vid)) == vector{b2.index, b1.index});
    CHECK(positions_of(set.indices(3_vid)).empty());

    CHECK(set.contains(1_vid));
    CHECK(set.contains(2_vid));
    CHECK(! set.contains(3_vid));
    CHECK(set.keys() == vector{1_vid, 2_vid});

    CHECK(set.first_constraint(1_vid) == a3);
    CHECK(set.first_constraint(2_vid) == b2);

    CHECK(set[a2].member_region_vid == 1_vid);
    CHECK(set[b1].member_region_vid == 2_vid);
}

TEST_CASE("Passenger data is returned unmodified")
{
    MemberConstraintSet<RegionVid> set;
    auto idx = set.add_member_constraint(OpaqueTypeKey{42, "impl Trait"}, HiddenType{"&'a u32"}, Span{3, 100, 120}, 6_vid, vector{1_vid});

    const auto & c = set[idx];
    CHECK(c.key.def_index == 42);
    CHECK(c.key.name == "impl Trait");
    CHECK(c.hidden_ty.description == "&'a u32");
    CHECK(c.definition_span.file == 3);
    CHECK(c.definition_span.lo == 100);
    CHECK(c.definition_span.hi == 120);
    CHECK(c.member_region_vid == 6_vid);

    auto mapped = move(set).into_mapped([](RegionVid r) { return ConstraintSccIndex{r.index}; });
    auto after = mapped.first_constraint(6_scc);
    CHECK(mapped[after].key.name == "impl Trait");
    CHECK(mapped[after].hidden_ty.description == "&'a u32");
    CHECK(mapped[after].definition_span.lo == 100);
    CHECK(mapped[after].member_region_vid == 6_vid);
}

TEST_CASE("Identity remap keeps every chain")
{
    MemberConstraintSet<RegionVid> set;
    for (auto r : {1_vid, 2_vid, 1_vid, 3_vid, 2_vid, 1_vid})
        add(set, r, {r, 0_vid});

    auto keys = set.keys();
    vector<vector<std::size_t>> before;
    for (auto k : keys)
        before.push_back(positions_of(set.indices(k)));

    unsigned calls = 0;
    auto mapped = move(set).into_mapped([&](RegionVid r) {
        ++calls;
        return r;
    });

    CHECK(calls == keys.size());
    CHECK(mapped.keys() == keys);
    for (std::size_t k = 0; k < keys.size(); ++k)
        CHECK(positions_of(mapped.indices(keys[k])) == before[k]);

    CHECK(positions_of(mapped.all_indices()) == vector<std::size_t>{0, 1, 2, 3, 4, 5});
    for (auto idx : mapped.all_indices())
        CHECK(choices_of(mapped, idx) == vector{mapped[idx].member_region_vid, 0_vid});

    CHECK(mapped.stats().merges == 0);
    CHECK(mapped.stats().splice_steps == 0);
    CHECK(mapped.stats().remaps == 1);
}

TEST_CASE("Two keys collapsing onto one")
{
    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 1_vid, {10_vid, 11_vid});
    auto b = add(set, 2_vid, {12_vid});

    auto mapped = move(set).into_mapped([](RegionVid) { return 3_vid; });

    CHECK(positions_of(mapped.indices(3_vid)) == vector{b.index, a.index});
    CHECK(positions_of(mapped.indices(1_vid)).empty());
    CHECK(positions_of(mapped.indices(2_vid)).empty());
    CHECK(mapped.keys() == vector{3_vid});

    CHECK(choices_of(mapped, mapped.first_constraint(3_vid)) == vector{12_vid});
    vector<vector<RegionVid>> choices;
    for (auto idx : mapped.indices(3_vid))
        choices.push_back(choices_of(mapped, idx));
    CHECK(choices == vector<vector<RegionVid>>{{12_vid}, {10_vid, 11_vid}});

    CHECK(mapped.stats().merges == 1);
}

TEST_CASE("Three keys collapsing onto one")
{
    MemberConstraintSet<RegionVid> set;
    auto c1 = add(set, 1_vid, {});
    auto c2 = add(set, 2_vid, {});
    auto c3 = add(set, 3_vid, {});

    auto mapped = move(set).into_mapped([](RegionVid) { return 4_scc; });

    CHECK(positions_of(mapped.indices(4_scc)) == vector{c3.index, c2.index, c1.index});
    CHECK(mapped.size() == 3);
    CHECK(mapped.stats().merges == 2);
    CHECK(mapped.stats().splice_steps == 0);
}

TEST_CASE("Collapsing longer chains keeps each chain's own order")
{
    MemberConstraintSet<RegionVid> set;
    auto a1 = add(set, 1_vid, {});
    auto a2 = add(set, 1_vid, {});
    auto b1 = add(set, 2_vid, {});
    auto b2 = add(set, 2_vid, {});
    auto c1 = add(set, 3_vid, {});
    auto d1 = add(set, 4_vid, {});

    auto mapped = move(set).into_mapped([](RegionVid r) { return r == 4_vid ? 1_scc : 0_scc; });

    CHECK(positions_of(mapped.indices(0_scc)) == vector{c1.index, b2.index, b1.index, a2.index, a1.index});
    CHECK(positions_of(mapped.indices(1_scc)) == vector{d1.index});
    CHECK(mapped.keys() == vector{0_scc, 1_scc});

    auto stats = mapped.stats();
    CHECK(stats.n_constraints == 6);
    CHECK(stats.n_keys == 2);
    CHECK(stats.merges == 2);
    // b2 -> b1 to reach the end of 2_vid's chain, c1 is already the end of its own
    CHECK(stats.splice_steps == 1);
}

TEST_CASE("Keys are processed in the order they were first seen")
{
    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 1_vid, {});
    auto b = add(set, 2_vid, {});
    auto c = add(set, 1_vid, {});

    CHECK(set.keys() == vector{1_vid, 2_vid});

    auto mapped = move(set).into_mapped([](RegionVid) { return 9_vid; });
    CHECK(positions_of(mapped.indices(9_vid)) == vector{b.index, c.index, a.index});
}

TEST_CASE("Only colliding keys are merged")
{
    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 1_vid, {});
    auto b = add(set, 2_vid, {});
    auto c = add(set, 3_vid, {});
    auto d = add(set, 4_vid, {});
    auto e = add(set, 5_vid, {});

    // 1, 3, 5 are one class, 2 and 4 are another
    auto mapped = move(set).into_mapped([](RegionVid r) { return ConstraintSccIndex{r.index % 2}; });

    CHECK(mapped.keys() == vector{1_scc, 0_scc});
    CHECK(positions_of(mapped.indices(1_scc)) == vector{e.index, c.index, a.index});
    CHECK(positions_of(mapped.indices(0_scc)) == vector{d.index, b.index});
    CHECK(positions_of(mapped.all_indices()) == vector<std::size_t>{0, 1, 2, 3, 4});
}

TEST_CASE("Remapping twice")
{
    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 1_vid, {});
    auto b = add(set, 2_vid, {});
    auto c = add(set, 3_vid, {});
    auto d = add(set, 4_vid, {});

    auto once = move(set).into_mapped([](RegionVid r) { return r.index <= 2 ? 1_vid : 3_vid; });
    CHECK(positions_of(once.indices(1_vid)) == vector{b.index, a.index});
    CHECK(positions_of(once.indices(3_vid)) == vector{d.index, c.index});

    auto twice = move(once).into_mapped([](RegionVid) { return 0_scc; });
    CHECK(positions_of(twice.indices(0_scc)) == vector{d.index, c.index, b.index, a.index});

    auto stats = twice.stats();
    CHECK(stats.remaps == 2);
    CHECK(stats.merges == 3);
    CHECK(stats.splice_steps == 1);
}

TEST_CASE("Handles belong to one set")
{
    MemberConstraintSet<RegionVid> set, other;
    auto a = add(set, 1_vid, {2_vid});
    add(set, 1_vid, {3_vid});
    auto x = add(other, 1_vid, {4_vid});

    SECTION("Handle from another set")
    {
        CHECK(x.index == a.index);
        CHECK_THROWS_AS(set[x], InvalidConstraintIndex);
        CHECK_THROWS_AS(set.choice_regions(x), InvalidConstraintIndex);
        CHECK_THROWS_AS(other[a], InvalidConstraintIndex);
    }

    SECTION("Handle out of range")
    {
        auto bogus = MemberConstraintIndex{17, a.owner};
        CHECK_THROWS_AS(set[bogus], InvalidConstraintIndex);
        CHECK_THROWS_AS(set.choice_regions(bogus), InvalidConstraintIndex);
    }

    SECTION("Handle from before a remap")
    {
        auto mapped = move(set).into_mapped([](RegionVid r) { return r; });
        CHECK_THROWS_AS(mapped[a], InvalidConstraintIndex);
        CHECK_THROWS_AS(set[a], InvalidConstraintIndex);
        CHECK(set.empty());

        auto renewed = mapped.first_constraint(1_vid);
        CHECK(renewed.index == 1);
        CHECK(choices_of(mapped, renewed) == vector{3_vid});
    }

    SECTION("Handles survive moving the set")
    {
        auto moved = move(set);
        CHECK(choices_of(moved, a) == vector{2_vid});
        CHECK_THROWS_AS(set[a], InvalidConstraintIndex);
        CHECK_THROWS_AS(add(set, 1_vid, {}), ConsumedSetUsed);
    }

    SECTION("A consumed set cannot be added to or remapped")
    {
        auto mapped = move(set).into_mapped([](RegionVid) { return 0_scc; });
        CHECK_THROWS_AS(add(set, 1_vid, {2_vid}), ConsumedSetUsed);
        CHECK_THROWS_AS(add(set, 1_vid, {2_vid}), UnexpectedException);
        CHECK_THROWS_AS(move(set).into_mapped([](RegionVid) { return 1_scc; }), ConsumedSetUsed);
        CHECK(set.empty());
        CHECK(positions_of(set.all_indices()).empty());
        CHECK(positions_of(mapped.indices(0_scc)) == vector<std::size_t>{1, 0});
    }
}

TEST_CASE("Asking for a key with no constraints")
{
    MemberConstraintSet<RegionVid> set;
    add(set, 1_vid, {});
    CHECK_THROWS_AS(set.first_constraint(2_vid), UnknownMemberRegion);
    CHECK_THROWS_AS(set.first_constraint(2_vid), UnexpectedException);

    auto mapped = move(set).into_mapped([](RegionVid) { return 5_scc; });
    CHECK_THROWS_AS(mapped.first_constraint(1_scc), UnknownMemberRegion);
    CHECK_NOTHROW(mapped.first_constraint(5_scc));
}

namespace
{
    struct Unprintable
    {
        int n;

        auto operator==(const Unprintable &) const -> bool = default;
    };
}

template <>
struct std::hash<Unprintable>
{
    auto operator()(const Unprintable & u) const noexcept -> std::size_t
    {
        return std::hash<int>{}(u.n);
    }
};

TEST_CASE("Keys that cannot be printed")
{
    STATIC_REQUIRE(RegionKey<Unprintable>);

    MemberConstraintSet<RegionVid> set;
    auto a = add(set, 1_vid, {2_vid});
    auto b = add(set, 2_vid, {});

    auto mapped = move(set).into_mapped([](RegionVid r) { return Unprintable{static_cast<int>(r.index % 2)}; });
    CHECK(mapped.contains(Unprintable{1}));
    CHECK(positions_of(mapped.indices(Unprintable{1})) == vector{a.index});
    CHECK(positions_of(mapped.indices(Unprintable{0})) == vector{b.index});
    CHECK_THROWS_AS(mapped.first_constraint(Unprintable{7}), UnknownMemberRegion);
}

TEST_CASE("Many keys collapsing onto one")
{
    MemberConstraintSet<RegionVid> set;
    for (unsigned long long r = 0; r < 10; ++r)
        for (int i = 0; i < 3; ++i)
            add(set, RegionVid{r}, {});

    auto mapped = move(set).into_mapped([](RegionVid) { return 0_scc; });

    auto chain = positions_of(mapped.indices(0_scc));
    REQUIRE(chain.size() == 30);
    vector<std::size_t> expected;
    for (std::size_t r = 10; r-- > 0;)
        for (std::size_t i = 3; i-- > 0;)
            expected.push_back(r * 3 + i);
    CHECK(chain == expected);

    // each of the nine merges walks the two links of the chain being processed
    CHECK(mapped.stats().merges == 9);
    CHECK(mapped.stats().splice_steps == 18);
}

#include <rcs/innards/set_identity.hh>

#include <atomic>

using namespace rcs;
using namespace rcs::innards;

using std::atomic;
using std::memory_order_relaxed;

namespace
{
    atomic<unsigned long long> next_identity{retired_set_identity + 1};
}

auto rcs::innards::next_member_constraint_set_identity() -> unsigned long long
{
    return next_identity.fetch_add(1, memory_order_relaxed);
}

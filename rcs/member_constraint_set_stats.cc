#include <rcs/member_constraint_set_stats.hh>

#include <ostream>

using namespace rcs;

using std::ostream;

auto rcs::operator<<(ostream & o, const MemberConstraintSetStats & s) -> ostream &
{
    o << "constraints: " << s.n_constraints << '\n';
    o << "choice regions: " << s.n_choice_regions << '\n';
    o << "keys: " << s.n_keys << '\n';
    o << "remaps: " << s.remaps << '\n';
    o << "merges: " << s.merges << '\n';
    o << "splice steps: " << s.splice_steps << '\n';
    return o;
}

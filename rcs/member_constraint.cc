#include <rcs/member_constraint.hh>

#include <ostream>

using namespace rcs;

using std::ostream;

auto rcs::operator<<(ostream & o, const MemberConstraintIndex & i) -> ostream &
{
    return o << "MemberConstraintIndex(" << i.index << ")";
}

#include <rcs/region_vid.hh>

#include <ostream>

using namespace rcs;

using std::ostream;

auto rcs::operator<<(ostream & o, const RegionVid & r) -> ostream &
{
    return o << r.to_string();
}

auto rcs::operator<<(ostream & o, const ConstraintSccIndex & s) -> ostream &
{
    return o << s.to_string();
}

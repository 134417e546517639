#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_RCS_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_RCS_HH 1

#include <rcs/exception.hh>
#include <rcs/member_constraint.hh>
#include <rcs/member_constraint_json.hh>
#include <rcs/member_constraint_set.hh>
#include <rcs/member_constraint_set_stats.hh>
#include <rcs/opaque_type.hh>
#include <rcs/region_vid.hh>

#endif

#pragma once

#include <cstdint>

namespace codestaff::db::model {

/*
  One row per identity, created on first contact and never deleted.
  `authorized` is a bitwise access level (see coordinator/access_level.hpp).
*/
struct UserRecord {
  int64_t id         = 0;
  int32_t authorized = 0;
};

}

#pragma once

#include <cstdint>
#include <string>

namespace codestaff::db::model {

/*
  Session credential scoped to an owner.

  The owner (`belong`) is fixed at insertion time.
*/
struct CookieRecord {
  std::string id;
  std::string csrf_token;
  std::string session_id;

  // unix seconds of last use, 0 = never
  int64_t last_login = 0;

  int64_t belong  = 0;
  bool    enabled = true;
};

}

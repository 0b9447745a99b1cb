#pragma once

#include <cstdint>
#include <string>

namespace codestaff::db::model {

/*
  Announced passcode.

  finalized only ever moves false -> true.
*/
struct CodeRecord {
  std::string code;

  // id of the outward announcement that carried the code
  int32_t message_ref = 0;

  bool finalized = false;
};

}

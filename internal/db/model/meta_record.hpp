#pragma once

#include <cstdint>
#include <string>

namespace codestaff::db::model {

inline constexpr const char* kMetaVersionStatusKey = "intel_v";

/*
  Decoded form of meta['intel_v'].
*/
struct VersionStatusRecord {
  std::string value;

  // unix seconds at which value was first recorded
  uint64_t last_seen = 0;
};

}

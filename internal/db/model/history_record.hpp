#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace codestaff::db::model {

struct HistoryRecord {
  int64_t                    entry_id  = 0;
  int64_t                    timestamp = 0;
  std::string                session_id;
  std::string                code;
  std::optional<std::string> error;
};

}

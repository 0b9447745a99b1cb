#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/coordinator/access_level.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using codestaff::client::CoordinatorClient;
using codestaff::coordinator::AccessLevel;
using codestaff::coordinator::AccessLevelName;
using codestaff::coordinator::CookieWrite;
using codestaff::coordinator::ParseAccessLevel;
using codestaff::util::FormatUnixSeconds;

static void Usage() {
  std::cout << "Usage:\n"
            << "  codestaffctl <config.yaml> user add <id>\n"
            << "  codestaffctl <config.yaml> user approve <id> <all|cookie|send|none>\n"
            << "  codestaffctl <config.yaml> user revoke <id>\n"
            << "  codestaffctl <config.yaml> user show <id>\n"
            << "  codestaffctl <config.yaml> user check <id> <all|cookie|send|none>\n"
            << "  codestaffctl <config.yaml> code add <code> <message_ref>\n"
            << "  codestaffctl <config.yaml> code show <code>\n"
            << "  codestaffctl <config.yaml> code finalize <code>\n"
            << "  codestaffctl <config.yaml> code resend <code>\n"
            << "  codestaffctl <config.yaml> cookie set <owner> <id> <csrf> <session>\n"
            << "  codestaffctl <config.yaml> cookie toggle <id> <on|off>\n"
            << "  codestaffctl <config.yaml> cookie capacity <id> <owner> <ceiling>\n"
            << "  codestaffctl <config.yaml> cookie show <id>\n"
            << "  codestaffctl <config.yaml> cookie list [owner|--enabled]\n"
            << "  codestaffctl <config.yaml> cookie touch <id>\n"
            << "  codestaffctl <config.yaml> history add <session_id> <code> [error]\n"
            << "  codestaffctl <config.yaml> history list [session_id]\n"
            << "  codestaffctl <config.yaml> status set <value>\n"
            << "  codestaffctl <config.yaml> status show\n";
}

// Coordinator stopped before answering.
static int NotPerformed() {
  std::cerr << "operation not performed\n";
  return 3;
}

static std::optional<AccessLevel> LevelArg(const std::string& value) {
  auto level = ParseAccessLevel(value);
  if (!level) std::cerr << "unknown access level: " << value << "\n";
  return level;
}

static void PrintCookie(const codestaff::db::model::CookieRecord& cookie) {
  std::cout << cookie.id << " owner=" << cookie.belong << " session=" << cookie.session_id
            << " enabled=" << (cookie.enabled ? "yes" : "no") << " last_login="
            << (cookie.last_login > 0 ? FormatUnixSeconds(cookie.last_login) : std::string("never")) << "\n";
}

static void PrintCode(const codestaff::db::model::CodeRecord& code) {
  std::cout << code.code << " message_ref=" << code.message_ref << " finalized=" << (code.finalized ? "yes" : "no")
            << "\n";
}

static int RunUser(const CoordinatorClient& client, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;
  const std::string& op = args[0];
  const int64_t      id = std::stoll(args[1]);

  if (op == "add") {
    auto added = client.AddUser(id);
    if (!added) return NotPerformed();
    std::cout << (*added ? "added" : "exists") << "\n";
    return 0;
  }

  if (op == "approve" || op == "check") {
    if (args.size() < 3) return 1;
    auto level = LevelArg(args[2]);
    if (!level) return 1;

    if (op == "approve") {
      if (!client.ApproveUser(id, *level)) return NotPerformed();
      std::cout << "approved " << id << " as " << args[2] << "\n";
      return 0;
    }

    auto allowed = client.CheckAccess(id, *level);
    if (!allowed) return NotPerformed();
    std::cout << (*allowed ? "allowed" : "denied") << "\n";
    return 0;
  }

  if (op == "revoke") {
    if (!client.RevokeUser(id)) return NotPerformed();
    std::cout << "revoked " << id << "\n";
    return 0;
  }

  if (op == "show") {
    auto user = client.QueryUser(id);
    if (!user) return NotPerformed();
    if (!*user) {
      std::cout << "not found\n";
      return 4;
    }
    std::cout << (*user)->id << " level=" << AccessLevelName((*user)->authorized) << " (" << (*user)->authorized << ")\n";
    return 0;
  }

  return 1;
}

static int RunCode(const CoordinatorClient& client, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;
  const std::string& op   = args[0];
  const std::string& code = args[1];

  if (op == "add") {
    if (args.size() < 3) return 1;
    auto added = client.AddCode(code, static_cast<int32_t>(std::stol(args[2])));
    if (!added) return NotPerformed();
    std::cout << (*added ? "added" : "exists") << "\n";
    return 0;
  }

  if (op == "show" || op == "finalize") {
    auto found = op == "show" ? client.QueryCode(code) : client.FinalizeCode(code);
    if (!found) return NotPerformed();
    if (!*found) {
      std::cout << "not found\n";
      return 4;
    }
    PrintCode(**found);
    return 0;
  }

  if (op == "resend") {
    auto published = client.ResendCode(code);
    if (!published) return NotPerformed();
    std::cout << (*published ? "resent" : "not found") << "\n";
    return *published ? 0 : 4;
  }

  return 1;
}

static int RunCookie(const CoordinatorClient& client, const std::vector<std::string>& args) {
  if (args.empty()) return 1;
  const std::string& op = args[0];

  if (op == "set") {
    if (args.size() < 5) return 1;
    auto outcome = client.SetCookie(std::stoll(args[1]), args[2], args[3], args[4]);
    if (!outcome) return NotPerformed();
    std::cout << codestaff::coordinator::ToString(*outcome) << "\n";
    return (*outcome == CookieWrite::Inserted || *outcome == CookieWrite::Updated) ? 0 : 5;
  }

  if (op == "toggle") {
    if (args.size() < 3 || (args[2] != "on" && args[2] != "off")) return 1;
    auto found = client.ToggleCookie(args[1], args[2] == "on");
    if (!found) return NotPerformed();
    std::cout << (*found ? "ok" : "not found") << "\n";
    return *found ? 0 : 4;
  }

  if (op == "capacity") {
    if (args.size() < 4) return 1;
    auto allowed = client.CheckCookieCapacity(args[1], std::stoll(args[2]), static_cast<uint32_t>(std::stoul(args[3])));
    if (!allowed) return NotPerformed();
    std::cout << (*allowed ? "allowed" : "full") << "\n";
    return 0;
  }

  if (op == "show") {
    if (args.size() < 2) return 1;
    auto cookie = client.QueryCookie(args[1]);
    if (!cookie) return NotPerformed();
    if (!*cookie) {
      std::cout << "not found\n";
      return 4;
    }
    PrintCookie(**cookie);
    return 0;
  }

  if (op == "list") {
    std::optional<std::vector<codestaff::db::model::CookieRecord>> cookies;
    if (args.size() >= 2 && args[1] != "--enabled") {
      cookies = client.QueryCookiesByOwner(std::stoll(args[1]));
    } else {
      cookies = client.QueryAllCookies(args.size() >= 2);
    }
    if (!cookies) return NotPerformed();
    for (const auto& cookie : *cookies) PrintCookie(cookie);
    return 0;
  }

  if (op == "touch") {
    if (args.size() < 2) return 1;
    auto found = client.TouchCookie(args[1]);
    if (!found) return NotPerformed();
    std::cout << (*found ? "ok" : "not found") << "\n";
    return *found ? 0 : 4;
  }

  return 1;
}

static int RunHistory(const CoordinatorClient& client, const std::vector<std::string>& args) {
  if (args.empty()) return 1;
  const std::string& op = args[0];

  if (op == "add") {
    if (args.size() < 3) return 1;
    std::optional<std::string> error;
    if (args.size() >= 4) error = args[3];
    if (!client.InsertHistory(args[1], args[2], error)) return NotPerformed();
    std::cout << "recorded\n";
    return 0;
  }

  if (op == "list") {
    std::optional<std::string> session;
    if (args.size() >= 2) session = args[1];

    auto rows = client.QueryHistory(session);
    if (!rows) return NotPerformed();
    for (const auto& row : *rows) {
      std::cout << FormatUnixSeconds(row.timestamp) << "  " << row.session_id << "  " << row.code;
      if (row.error) std::cout << "  error=" << *row.error;
      std::cout << "\n";
    }
    return 0;
  }

  return 1;
}

static int RunStatus(const CoordinatorClient& client, const std::vector<std::string>& args) {
  if (args.empty()) return 1;

  if (args[0] == "set") {
    if (args.size() < 2) return 1;
    auto changed = client.UpdateVersionStatus(args[1]);
    if (!changed) return NotPerformed();
    std::cout << (*changed ? "updated" : "unchanged") << "\n";
    return 0;
  }

  if (args[0] == "show") {
    auto status = client.QueryVersionStatus();
    if (!status) return NotPerformed();
    if (!*status) {
      std::cout << "not set\n";
      return 4;
    }
    std::cout << (*status)->value << " since " << FormatUnixSeconds(static_cast<int64_t>((*status)->last_seen)) << "\n";
    return 0;
  }

  return 1;
}

static int Dispatch(const CoordinatorClient& client, const std::string& group, const std::vector<std::string>& args) {
  if (group == "user") return RunUser(client, args);
  if (group == "code") return RunCode(client, args);
  if (group == "cookie") return RunCookie(client, args);
  if (group == "history") return RunHistory(client, args);
  if (group == "status") return RunStatus(client, args);
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              group       = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = codestaff::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.logging().level().empty()) config.mutable_logging()->set_level("warn");
    codestaff::observability::InitializeLogging(config);

    auto app = codestaff::factory::Build(config);

    int rc = Dispatch(*app.client, group, args);

    if (!app.client->Terminate()) {
      std::cerr << "coordinator already stopped\n";
    }
    app.coordinator->Wait();

    if (rc == 1) Usage();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "codestaffctl: " << e.what() << "\n";
    return 2;
  }
}

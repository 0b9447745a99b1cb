#include "internal/factory.hpp"

#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace codestaff::factory {

namespace obs = codestaff::observability;

namespace {

std::shared_ptr<db::sqlite::SqliteDB> OpenStore(const std::string& path) {
  std::shared_ptr<db::sqlite::SqliteDB> sqlite_db;
  try {
    sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
  } catch (const util::StoreError& e) {
    throw util::SchemaError(std::string("store unreachable: ") + e.what());
  }
  return sqlite_db;
}

std::shared_ptr<db::Repository> BuildRepository(const codestaff::runtime::config::RuntimeConfig& config) {
  auto sqlite_db = OpenStore(config.database().path());

  db::sqlite::SqliteMigrationExecutor executor(sqlite_db);
  const int version = db::sql::EnsureSchema(executor);
  CODESTAFF_LOG_INFO("store ready", {obs::StringField("path", sqlite_db->Path()), obs::IntField("schema_version", version)});

  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const codestaff::runtime::config::RuntimeConfig& runtime_config) {
  auto config = runtime_config;
  codestaff::config::ConfigLoader::ApplyDefaults(config);

  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Notification bus
  // ------------------------------------------------------------------
  app.bus = std::make_shared<bus::NotificationBus>(config.bus().capacity());

  // ------------------------------------------------------------------
  // Coordinator
  // ------------------------------------------------------------------
  coordinator::CoordinatorOptions options;
  options.queue_capacity = config.coordinator().queue_capacity();
  options.cookie_ceiling = config.coordinator().cookie_ceiling();
  options.exempt_owners.assign(config.coordinator().exempt_owners().begin(), config.coordinator().exempt_owners().end());

  app.coordinator = std::make_shared<coordinator::Coordinator>(app.repository, app.bus, std::move(options));
  app.coordinator->Start();

  app.client = std::make_shared<client::CoordinatorClient>(app.coordinator->Queue());

  return app;
}

} // namespace codestaff::factory

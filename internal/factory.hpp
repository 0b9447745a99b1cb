#pragma once

#include <memory>

#include "client/cpp/codestaff_client.h"
#include "config/config.pb.h"
#include "internal/bus/notification_bus.hpp"
#include "internal/coordinator/coordinator.hpp"
#include "internal/db/api/repository.hpp"

namespace codestaff::factory {

/*
  Application

  Everything that lives for the lifetime of the process. The coordinator
  is already running when Build returns; callers talk to it through
  `client` and observe it through `bus`.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<bus::NotificationBus>       bus;
  std::shared_ptr<coordinator::Coordinator>   coordinator;
  std::shared_ptr<client::CoordinatorClient>  client;
};

/*
  Build

  Opens the store, brings its schema to the current version and starts
  the coordinator. This is the only place that knows concrete DB types.

  Throws util::SchemaError when the store is unreachable or its schema
  cannot be brought up to date.
*/
Application Build(const codestaff::runtime::config::RuntimeConfig& config);

} // namespace codestaff::factory

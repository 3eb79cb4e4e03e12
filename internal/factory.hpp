#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/delivery/delivery_worker.hpp"
#include "internal/queue/event_queue_store.hpp"

namespace asqueue::factory {

/*
  Runtime

  Owns all long-lived objects built from the config.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<queue::EventQueueStore> store;
  delivery::DeliveryOptions               delivery;
};

/*
  Opens the configured backend and applies the schema.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const asqueue::runtime::config::RuntimeConfig& config);

// Expects a validated config (config::ConfigLoader::Validate).
Runtime Build(const asqueue::runtime::config::RuntimeConfig& config);

} // namespace asqueue::factory

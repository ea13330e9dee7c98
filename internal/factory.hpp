#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/flow/flow_registry.hpp"
#include "internal/lock/content_lock.hpp"
#include "internal/object/object_factory.hpp"
#include "internal/schema/schema_registry.hpp"
#include "internal/store/attribute_store.hpp"
#include "internal/util/time.hpp"

namespace aff4::factory {

/*
  RuntimeDependencies

  Owns all long-lived components of one store instance.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<store::AttributeStore>        store;
  schema::SchemaRegistryPtr                     schema;
  std::shared_ptr<const util::TimeSource>       clock;
  std::shared_ptr<flow::FlowRegistry>           flows;
  std::shared_ptr<lock::ContentLockCoordinator> content_lock;
  std::shared_ptr<object::ObjectFactory>        objects;
};

/*
  Build

  Composition root. The only place that knows concrete repository types.
  Passing no clock uses the system clock.
*/
RuntimeDependencies Build(const aff4::store::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock = nullptr);

} // namespace aff4::factory

#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/default_schema.hpp"
#if AFF4_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace aff4::factory {

namespace {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const aff4::store::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if AFF4_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("sqlite backend requires database.sqlite.path");
    }
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->Bootstrap();
    AFF4_LOG_INFO("sqlite repository ready", {StringField("path", database.sqlite().path())});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  AFF4_LOG_INFO("memory repository ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

RuntimeDependencies Build(const aff4::store::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock) {
  RuntimeDependencies deps;

  deps.clock      = clock ? std::move(clock) : std::make_shared<util::SystemTimeSource>();
  deps.schema     = schema::DefaultRegistry();
  deps.repository = BuildRepository(config);
  deps.store      = std::make_shared<store::AttributeStore>(deps.repository);

  deps.flows        = std::make_shared<flow::FlowRegistry>(deps.store, deps.schema, deps.clock);
  deps.content_lock = std::make_shared<lock::ContentLockCoordinator>(deps.store, deps.flows, deps.clock, config.flows().content_flow_name());

  deps.objects = std::make_shared<object::ObjectFactory>(object::ObjectContext{
      .store        = deps.store,
      .schema       = deps.schema,
      .clock        = deps.clock,
      .content_lock = deps.content_lock,
  });

  return deps;
}

} // namespace aff4::factory

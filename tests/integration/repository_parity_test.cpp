#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "aff4/store/v1/paths.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/flow/flow_registry.hpp"
#include "internal/lock/content_lock.hpp"
#include "internal/object/object_factory.hpp"
#include "internal/object/vfs_file.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/schema/values.hpp"
#include "internal/store/attribute_store.hpp"

#if AFF4_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

namespace attrs  = aff4::schema::attrs;
namespace values = aff4::schema::values;

using aff4::db::ErrorCode;
using aff4::db::Repository;
using aff4::db::memory::MemoryRepository;
using aff4::db::model::AttributeRecord;
using aff4::object::Mode;
using aff4::object::VfsFile;
using aff4::urn::Urn;
using aff4::util::kMicrosPerSecond;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

AttributeRecord Record(const std::string& urn, const std::string& attribute, uint64_t ts, const std::string& value) {
  return AttributeRecord{.urn = urn, .attribute = attribute, .timestamp_us = ts, .value = value};
}

void VerifyAppendAndRead(Repository& repo, const std::string& urn) {
  auto tx = repo.Begin();

  assert(repo.AppendRecords(*tx, {Record(urn, "a", 10, "v1"), Record(urn, "b", 10, "b1")}));
  assert(repo.AppendRecords(*tx, {Record(urn, "a", 20, "v2")}));

  // reads inside the transaction see its writes
  auto latest = repo.GetLatest(*tx, urn, "a", UINT64_MAX);
  assert(latest.has_value());
  assert(latest->value == "v2");
  assert(latest->timestamp_us == 20);

  tx->Commit();

  auto read = repo.Begin();
  assert(repo.GetLatest(*read, urn, "a", 15)->value == "v1");
  assert(!repo.GetLatest(*read, urn, "a", 5).has_value());

  const auto history = repo.GetHistory(*read, urn, "a");
  assert(history.size() == 2);
  assert(history[0].value == "v1");
  assert(history[1].value == "v2");

  auto snapshot = repo.GetSnapshot(*read, urn, UINT64_MAX);
  assert(snapshot.size() == 2);

  assert(repo.Exists(*read, urn));
  read->Rollback();
}

void VerifyBinaryValues(Repository& repo, const std::string& urn) {
  const std::string blob("\0\x01\xff" "binary", 9);

  auto tx = repo.Begin();
  assert(repo.AppendRecords(*tx, {Record(urn, "blob", 1, blob)}));
  tx->Commit();

  auto read = repo.Begin();
  assert(repo.GetLatest(*read, urn, "blob", UINT64_MAX)->value == blob);
  read->Rollback();
}

void VerifyDuplicateVersionRejected(Repository& repo, const std::string& urn) {
  auto tx = repo.Begin();
  assert(repo.AppendRecords(*tx, {Record(urn, "a", 10, "v1")}));

  auto dup = repo.AppendRecords(*tx, {Record(urn, "a", 10, "again")});
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& urn) {
  {
    auto tx = repo.Begin();
    assert(repo.AppendRecords(*tx, {Record(urn, "a", 1, "gone")}));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.Exists(*check_tx, urn));
  check_tx->Rollback();
}

void VerifyListChildren(Repository& repo, const std::string& root) {
  auto tx = repo.Begin();
  assert(repo.AppendRecords(*tx, {
                                     Record(root + "/fs/os/etc/passwd", "t", 1, "x"),
                                     Record(root + "/fs/os/etc.d", "t", 1, "x"),
                                     Record(root + "/flows/F:1", "t", 1, "x"),
                                     Record(root + "0/other", "t", 1, "x"),
                                 }));
  tx->Commit();

  auto       read     = repo.Begin();
  const auto children = repo.ListChildren(*read, root);
  assert(children.size() == 2);
  assert(children[0] == root + "/flows");
  assert(children[1] == root + "/fs");

  const auto os = repo.ListChildren(*read, root + "/fs/os");
  assert(os.size() == 2);
  assert(os[0] == root + "/fs/os/etc");
  assert(os[1] == root + "/fs/os/etc.d");
  read->Rollback();
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& urn, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.AppendRecords(*tx1, {Record(urn, "a", 1, "one")}));
  assert(repo.AppendRecords(*tx2, {Record(urn, "a", 2, "two")}));
  tx1->Commit();

  bool conflict = false;
  try {
    tx2->Commit();
  } catch (const aff4::db::RepositoryError& e) {
    conflict = e.result().code == ErrorCode::Conflict;
  }
  assert(conflict);
}

// Same object-level scenario on every backend.
void VerifyObjectLifecycle(const std::shared_ptr<Repository>& repo, const std::string& client_id) {
  auto clock  = std::make_shared<aff4::util::ManualTimeSource>(kMicrosPerSecond);
  auto store  = std::make_shared<aff4::store::AttributeStore>(repo);
  auto schema = aff4::schema::DefaultRegistry();
  auto flows  = std::make_shared<aff4::flow::FlowRegistry>(store, schema, clock);
  auto lock   = std::make_shared<aff4::lock::ContentLockCoordinator>(store, flows, clock, "MultiGetFile");

  aff4::object::ObjectFactory objects(aff4::object::ObjectContext{.store = store, .schema = schema, .clock = clock, .content_lock = lock});

  const auto path = Urn(client_id).Add("fs/os/c/bin/bash");
  {
    auto file = objects.Create<VfsFile>(path);
    file->Write("#!/bin/bash\n");
  }

  clock->SetSeconds(2);
  {
    auto file = objects.Open<VfsFile>(path, Mode::kReadWrite);
    file->Set(attrs::kStat, values::Message(aff4::store::v1::StatEntry()));
    const auto first = file->Update();
    assert(file->Update() == first);
    flows->Finish(first);
    assert(file->Update() != first);
  }

  auto file = objects.Open<VfsFile>(path);
  assert(file->ContentAge() == 1 * kMicrosPerSecond);
  assert(file->Size() == 12);
  assert(flows->ListFlows(client_id).size() == 2);
  assert(objects.Open<VfsFile>(path, Mode::kRead, kMicrosPerSecond)->GetHistory(attrs::kContent).size() == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& urn) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    aff4::store::AttributeStore store(repo);
    store.Write(Urn(urn), {{attrs::kType, values::String("VFSFile")}, {attrs::kSize, values::Integer(11)}}, 100);
    store.Write(Urn(urn), {{attrs::kSize, values::Integer(12)}}, 200);
  }

  backend.restart(repo);

  aff4::store::AttributeStore store(repo);
  assert(store.Exists(Urn(urn)));
  assert(store.Read(Urn(urn), attrs::kSize)->value.integer_value() == 12);
  assert(store.Read(Urn(urn), attrs::kSize, 150)->value.integer_value() == 11);
  assert(store.ReadAll(Urn(urn), attrs::kSize).size() == 2);

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if AFF4_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("aff4_store_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db   = std::make_shared<aff4::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<aff4::db::sqlite::SqliteRepository>(std::move(db));
    repo->Bootstrap();
    return repo;
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const std::string root = "aff4:/C." + backend.name;

  VerifyAppendAndRead(*repo, root + "/append");
  VerifyBinaryValues(*repo, root + "/binary");
  VerifyDuplicateVersionRejected(*repo, root + "/duplicate");
  VerifyRollbackBehavior(*repo, root + "/rollback");
  VerifyListChildren(*repo, root + "-tree");
  VerifyConcurrentTransactions(*repo, root + "/concurrency", backend.supports_parallel_transactions);
  VerifyObjectLifecycle(repo, "C." + backend.name + "-objects");

  VerifyRestartDurability(backend, root + "/durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if AFF4_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "aff4_store_integration_repository_parity: pass\n";
  return 0;
}

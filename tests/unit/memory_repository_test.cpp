#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using aff4::db::ErrorCode;
using aff4::db::RepositoryError;
using aff4::db::memory::MemoryRepository;
using aff4::db::model::AttributeRecord;

AttributeRecord Record(const std::string& urn, const std::string& attribute, uint64_t ts, const std::string& value) {
  return AttributeRecord{.urn = urn, .attribute = attribute, .timestamp_us = ts, .value = value};
}

void TestWritesInvisibleUntilCommit() {
  MemoryRepository repo;

  auto writer = repo.Begin();
  assert(repo.AppendRecords(*writer, {Record("aff4:/C.1", "a", 10, "v1")}));
  assert(repo.GetLatest(*writer, "aff4:/C.1", "a", UINT64_MAX).has_value());

  {
    auto reader = repo.Begin();
    assert(!repo.Exists(*reader, "aff4:/C.1"));
    reader->Rollback();
  }

  writer->Commit();

  auto reader = repo.Begin();
  assert(repo.Exists(*reader, "aff4:/C.1"));
}

void TestRollbackDiscards() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.AppendRecords(*tx, {Record("aff4:/C.1", "a", 10, "v1")}));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.AppendRecords(*tx, {Record("aff4:/C.2", "a", 10, "v1")}));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.Exists(*tx, "aff4:/C.1"));
  assert(!repo.Exists(*tx, "aff4:/C.2"));
}

void TestLatestHonoursAsOf() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  assert(repo.AppendRecords(*tx, {Record("aff4:/C.1", "a", 10, "v1"), Record("aff4:/C.1", "b", 10, "b1")}));
  assert(repo.AppendRecords(*tx, {Record("aff4:/C.1", "a", 20, "v2")}));
  tx->Commit();

  auto read = repo.Begin();
  assert(repo.GetLatest(*read, "aff4:/C.1", "a", UINT64_MAX)->value == "v2");
  assert(repo.GetLatest(*read, "aff4:/C.1", "a", 19)->value == "v1");
  assert(repo.GetLatest(*read, "aff4:/C.1", "a", 20)->value == "v2");
  assert(!repo.GetLatest(*read, "aff4:/C.1", "a", 9).has_value());

  const auto history = repo.GetHistory(*read, "aff4:/C.1", "a");
  assert(history.size() == 2);
  assert(history[0].timestamp_us == 10);
  assert(history[1].timestamp_us == 20);

  const auto snapshot = repo.GetSnapshot(*read, "aff4:/C.1", 15);
  assert(snapshot.size() == 2);
  for (const auto& record : snapshot) {
    assert(record.timestamp_us == 10);
  }
}

void TestDuplicateVersionIsRejected() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  assert(repo.AppendRecords(*tx, {Record("aff4:/C.1", "a", 10, "v1")}));

  auto dup = repo.AppendRecords(*tx, {Record("aff4:/C.1", "b", 10, "b1"), Record("aff4:/C.1", "a", 10, "again")});
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);
  // the whole call is rejected
  assert(!repo.GetLatest(*tx, "aff4:/C.1", "b", UINT64_MAX).has_value());
}

void TestListChildren() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  assert(repo.AppendRecords(*tx, {
                                     Record("aff4:/C.1", "t", 1, "x"),
                                     Record("aff4:/C.1/fs/os/etc/passwd", "t", 1, "x"),
                                     Record("aff4:/C.1/fs/os/etc.d", "t", 1, "x"),
                                     Record("aff4:/C.1/flows/F:1", "t", 1, "x"),
                                     Record("aff4:/C.10", "t", 1, "x"),
                                 }));
  tx->Commit();

  auto       read     = repo.Begin();
  const auto children = repo.ListChildren(*read, "aff4:/C.1/fs/os");
  assert(children.size() == 2);
  assert(children[0] == "aff4:/C.1/fs/os/etc");
  assert(children[1] == "aff4:/C.1/fs/os/etc.d");

  const auto top = repo.ListChildren(*read, "aff4:/C.1");
  assert(top.size() == 2);

  const auto root = repo.ListChildren(*read, "aff4:/");
  assert(root.size() == 2);

  // intermediate path components are not objects of their own
  assert(!repo.Exists(*read, "aff4:/C.1/fs"));
}

void TestConcurrentCommitConflicts() {
  MemoryRepository repo;

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  assert(repo.AppendRecords(*tx1, {Record("aff4:/C.1", "a", 10, "one")}));
  assert(repo.AppendRecords(*tx2, {Record("aff4:/C.1", "a", 11, "two")}));
  tx1->Commit();

  bool conflict = false;
  try {
    tx2->Commit();
  } catch (const RepositoryError& e) {
    conflict = e.result().code == ErrorCode::Conflict;
  }
  assert(conflict);

  auto read = repo.Begin();
  assert(repo.GetLatest(*read, "aff4:/C.1", "a", UINT64_MAX)->value == "one");
}

} // namespace

int main() {
  TestWritesInvisibleUntilCommit();
  TestRollbackDiscards();
  TestLatestHonoursAsOf();
  TestDuplicateVersionIsRejected();
  TestListChildren();
  TestConcurrentCommitConflicts();

  std::cout << "aff4_store_unit_memory_repository: pass\n";
  return 0;
}

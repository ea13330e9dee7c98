#include "internal/flow/flow_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace attrs = aff4::schema::attrs;

using aff4::flow::FlowRegistry;
using aff4::flow::FlowStatus;
using aff4::urn::Urn;

struct Fixture {
  std::shared_ptr<aff4::util::ManualTimeSource> clock = std::make_shared<aff4::util::ManualTimeSource>(aff4::util::kMicrosPerSecond);
  std::shared_ptr<aff4::store::AttributeStore>  store =
      std::make_shared<aff4::store::AttributeStore>(std::make_shared<aff4::db::memory::MemoryRepository>());
  FlowRegistry flows{store, aff4::schema::DefaultRegistry(), clock};
};

void TestStartRecordsRunningFlow() {
  Fixture   f;
  const Urn target("C.1/fs/os/c/bin/bash");

  const auto flow = f.flows.Start("MultiGetFile", target);

  assert(flow.Dirname() == Urn("C.1/flows"));
  assert(flow.Basename().size() == 10);
  assert(flow.Basename().rfind("F:", 0) == 0);

  assert(f.flows.Status(flow) == FlowStatus::kRunning);
  assert(f.flows.FlowName(flow) == "MultiGetFile");
  assert(f.store->Read(flow, attrs::kFlowTarget)->value.urn_value() == target.Value());
  assert(f.store->Read(flow, attrs::kType)->value.string_value() == aff4::schema::kinds::kFlow);
}

void TestFinishAndFail() {
  Fixture f;

  const auto ok  = f.flows.Start("MultiGetFile", Urn("C.1/fs/os/a"));
  const auto bad = f.flows.Start("MultiGetFile", Urn("C.1/fs/os/b"));
  assert(ok != bad);

  f.flows.Finish(ok);
  f.flows.Fail(bad, "client went away");

  assert(f.flows.Status(ok) == FlowStatus::kFinished);
  assert(f.flows.Status(bad) == FlowStatus::kErrored);
  assert(f.store->Read(bad, attrs::kFlowError)->value.string_value() == "client went away");

  // terminal states are final
  bool threw = false;
  try {
    f.flows.Finish(bad);
  } catch (const aff4::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownFlow() {
  Fixture f;

  bool threw = false;
  try {
    f.flows.Status(Urn("C.1/flows/F:DEADBEEF"));
  } catch (const aff4::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListFlowsPerClient() {
  Fixture f;

  f.flows.Start("MultiGetFile", Urn("C.1/fs/os/a"));
  f.flows.Start("MultiGetFile", Urn("C.1/fs/os/b"));
  f.flows.Start("MultiGetFile", Urn("C.2/fs/os/a"));

  assert(f.flows.ListFlows("C.1").size() == 2);
  assert(f.flows.ListFlows("C.2").size() == 1);
  assert(f.flows.ListFlows("C.3").empty());
}

void TestTargetWithoutClient() {
  Fixture f;

  bool threw = false;
  try {
    f.flows.Start("MultiGetFile", Urn());
  } catch (const aff4::util::InvalidUrn&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStartRecordsRunningFlow();
  TestFinishAndFail();
  TestUnknownFlow();
  TestListFlowsPerClient();
  TestTargetWithoutClient();

  std::cout << "aff4_store_unit_flow_registry: pass\n";
  return 0;
}

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "flow_runner.hpp"
#include "internal/schema/schema_registry.hpp"
#include "internal/store/attribute_store.hpp"
#include "internal/util/time.hpp"

namespace aff4::flow {

/*
  FlowRegistry

  FlowRunner that records flows as objects in the attribute store:

    aff4:/<client-id>/flows/F:<8 hex digits>

  Starting a flow only writes its record in state RUNNING; whoever executes
  the flow reports completion through Finish() or Fail().
*/
class FlowRegistry final : public FlowRunner {
 public:
  FlowRegistry(store::AttributeStorePtr store, schema::SchemaRegistryPtr schema, std::shared_ptr<const util::TimeSource> clock);

  urn::Urn Start(const std::string& flow_name, const urn::Urn& target) override;

  // Throws util::NotFound for unknown flows.
  FlowStatus Status(const urn::Urn& flow) override;

  void Finish(const urn::Urn& flow);
  void Fail(const urn::Urn& flow, const std::string& error);

  std::string FlowName(const urn::Urn& flow);

  std::vector<urn::Urn> ListFlows(const std::string& client_id);

 private:
  void Transition(const urn::Urn& flow, FlowStatus to, store::AttributeBatch batch);
  void Validate(const store::AttributeBatch& batch) const;

  store::AttributeStorePtr                store_;
  schema::SchemaRegistryPtr               schema_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace aff4::flow

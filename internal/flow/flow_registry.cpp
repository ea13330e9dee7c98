#include "flow_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/schema/values.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace aff4::flow {

namespace {

using observability::StringField;

urn::Urn FlowsRoot(const std::string& client_id) {
  return urn::Urn(client_id).Add("flows");
}

FlowStatus ParseStatus(const std::string& state, const urn::Urn& flow) {
  if (state == ToString(FlowStatus::kRunning)) return FlowStatus::kRunning;
  if (state == ToString(FlowStatus::kFinished)) return FlowStatus::kFinished;
  if (state == ToString(FlowStatus::kErrored)) return FlowStatus::kErrored;
  throw util::InvalidState("flow " + flow.Value() + " has unknown state " + state);
}

} // namespace

FlowRegistry::FlowRegistry(store::AttributeStorePtr store, schema::SchemaRegistryPtr schema, std::shared_ptr<const util::TimeSource> clock)
    : store_(std::move(store)), schema_(std::move(schema)), clock_(std::move(clock)) {
}

void FlowRegistry::Validate(const store::AttributeBatch& batch) const {
  for (const auto& [attribute, value] : batch) {
    schema::SchemaRegistry::Validate(schema_->Lookup(schema::kinds::kFlow, attribute), value);
  }
}

urn::Urn FlowRegistry::Start(const std::string& flow_name, const urn::Urn& target) {
  const auto client_id = target.RootId();
  if (client_id.empty()) {
    throw util::InvalidUrn("flow target has no client: " + target.Value());
  }

  const auto flow = FlowsRoot(client_id).Add("F:" + util::ToShortHex(util::GenerateUUID(), 4));

  store::AttributeBatch batch{
      {schema::attrs::kType, schema::values::String(schema::kinds::kFlow)},
      {schema::attrs::kFlowName, schema::values::String(flow_name)},
      {schema::attrs::kFlowState, schema::values::String(ToString(FlowStatus::kRunning))},
      {schema::attrs::kFlowTarget, schema::values::UrnValue(target)},
  };
  Validate(batch);
  store_->Write(flow, batch, clock_->NowMicros());

  AFF4_LOG_INFO("flow started", {StringField("flow", flow.Value()), StringField("name", flow_name), StringField("target", target.Value())});
  return flow;
}

FlowStatus FlowRegistry::Status(const urn::Urn& flow) {
  auto state = store_->Read(flow, schema::attrs::kFlowState);
  if (!state) {
    throw util::NotFound("unknown flow " + flow.Value());
  }
  return ParseStatus(state->value.string_value(), flow);
}

void FlowRegistry::Transition(const urn::Urn& flow, FlowStatus to, store::AttributeBatch batch) {
  const auto from = Status(flow);
  if (from != FlowStatus::kRunning) {
    throw util::InvalidState("flow " + flow.Value() + " already " + std::string(ToString(from)));
  }

  batch.emplace(schema::attrs::kFlowState, schema::values::String(ToString(to)));
  Validate(batch);
  store_->Write(flow, batch, clock_->NowMicros());

  AFF4_LOG_INFO("flow completed", {StringField("flow", flow.Value()), StringField("state", ToString(to))});
}

void FlowRegistry::Finish(const urn::Urn& flow) {
  Transition(flow, FlowStatus::kFinished, {});
}

void FlowRegistry::Fail(const urn::Urn& flow, const std::string& error) {
  Transition(flow, FlowStatus::kErrored, {{schema::attrs::kFlowError, schema::values::String(error)}});
}

std::string FlowRegistry::FlowName(const urn::Urn& flow) {
  auto name = store_->Read(flow, schema::attrs::kFlowName);
  if (!name) {
    throw util::NotFound("unknown flow " + flow.Value());
  }
  return name->value.string_value();
}

std::vector<urn::Urn> FlowRegistry::ListFlows(const std::string& client_id) {
  return store_->ListChildren(FlowsRoot(client_id));
}

} // namespace aff4::flow

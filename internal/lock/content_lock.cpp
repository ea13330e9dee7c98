#include "content_lock.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/schema/values.hpp"
#include "internal/util/errors.hpp"

namespace aff4::lock {

using observability::StringField;

ContentLockCoordinator::ContentLockCoordinator(store::AttributeStorePtr store, std::shared_ptr<flow::FlowRunner> flows,
                                               std::shared_ptr<const util::TimeSource> clock, std::string flow_name)
    : store_(std::move(store)), flows_(std::move(flows)), clock_(std::move(clock)), flow_name_(std::move(flow_name)) {
  if (!store_ || !flows_ || !clock_) {
    throw std::invalid_argument("ContentLockCoordinator requires a store, a flow runner and a clock");
  }
}

std::optional<flow::FlowStatus> ContentLockCoordinator::QueryStatus(const urn::Urn& flow) {
  try {
    return flows_->Status(flow);
  } catch (const util::NotFound& e) {
    AFF4_LOG_WARN("content lock names an unknown flow", {StringField("flow", flow.Value()), StringField("error", e.what())});
    return std::nullopt;
  } catch (const util::LockStatusUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::LockStatusUnavailable("status of " + flow.Value() + ": " + e.what());
  }
}

std::optional<urn::Urn> ContentLockCoordinator::ActiveHolder(const urn::Urn& target) {
  auto current = store_->Read(target, schema::attrs::kContentLock);
  if (!current || !current->value.has_urn_value()) {
    return std::nullopt;
  }

  urn::Urn holder(current->value.urn_value());
  if (QueryStatus(holder) != flow::FlowStatus::kRunning) {
    return std::nullopt;
  }
  return holder;
}

ContentLock ContentLockCoordinator::Update(const urn::Urn& target) {
  auto current = store_->Read(target, schema::attrs::kContentLock);
  if (current && current->value.has_urn_value()) {
    urn::Urn   holder(current->value.urn_value());
    const auto status = QueryStatus(holder);
    if (status == flow::FlowStatus::kRunning) {
      AFF4_LOG_DEBUG("content lock held by running flow", {StringField("urn", target.Value()), StringField("flow", holder.Value())});
      return ContentLock{.flow = holder, .timestamp = current->timestamp, .started = false};
    }

    AFF4_LOG_INFO("content lock holder no longer running",
                  {StringField("urn", target.Value()), StringField("flow", holder.Value()), StringField("status", status ? flow::ToString(*status) : "MISSING")});
  }

  auto flow = flows_->Start(flow_name_, target);

  const auto timestamp = store_->Write(target, {{schema::attrs::kContentLock, schema::values::UrnValue(flow)}}, clock_->NowMicros());

  AFF4_LOG_INFO("content lock acquired", {StringField("urn", target.Value()), StringField("flow", flow.Value())});
  return ContentLock{.flow = flow, .timestamp = timestamp, .started = true};
}

} // namespace aff4::lock

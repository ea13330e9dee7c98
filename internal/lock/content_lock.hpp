#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/flow/flow_runner.hpp"
#include "internal/store/attribute_store.hpp"
#include "internal/util/time.hpp"

namespace aff4::lock {

struct ContentLock {
  urn::Urn        flow;
  util::Timestamp timestamp = 0;
  // false when an already running flow holds the lock
  bool started = false;
};

/*
  ContentLockCoordinator

  Keeps at most one content collection flow per file by recording the
  owning flow in the file's content lock attribute.

    Unlocked --Update()--> Locked(flow) --flow finishes/errors--> Unlocked

  There is no unlock call: a lock whose flow is no longer running is
  simply replaced. The lock is advisory. Two Update() calls racing on one
  file are ordered only by the repository's write ordering, so both may
  start a flow; the later write wins the attribute.
*/
class ContentLockCoordinator {
 public:
  ContentLockCoordinator(store::AttributeStorePtr store, std::shared_ptr<flow::FlowRunner> flows, std::shared_ptr<const util::TimeSource> clock,
                         std::string flow_name);

  // Returns the flow owning the content of `target`, starting one if needed.
  // A holder the flow runner no longer knows counts as not running.
  // Throws util::LockStatusUnavailable if the holder's status cannot be
  // queried; errors from starting a flow propagate unchanged and leave no lock.
  ContentLock Update(const urn::Urn& target);

  // Holder of the lock if its flow is still running.
  std::optional<urn::Urn> ActiveHolder(const urn::Urn& target);

  const std::string& FlowName() const {
    return flow_name_;
  }

 private:
  // nullopt when the runner has no record of `flow`.
  std::optional<flow::FlowStatus> QueryStatus(const urn::Urn& flow);

  store::AttributeStorePtr                store_;
  std::shared_ptr<flow::FlowRunner>       flows_;
  std::shared_ptr<const util::TimeSource> clock_;
  std::string                             flow_name_;
};

} // namespace aff4::lock

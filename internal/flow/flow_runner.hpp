#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/urn/urn.hpp"

namespace aff4::flow {

enum class FlowStatus : std::uint8_t {
  kRunning = 0,
  kFinished,
  kErrored,
};

constexpr std::string_view ToString(FlowStatus status) {
  switch (status) {
    case FlowStatus::kRunning:
      return "RUNNING";
    case FlowStatus::kFinished:
      return "FINISHED";
    case FlowStatus::kErrored:
      return "ERROR";
  }
  return "UNKNOWN";
}

/*
  Flow execution collaborator.

  Start() schedules a background collection flow and returns its reference
  without waiting for it. Status() reports where the flow is; transient
  failures are thrown, never reported as a status.
*/
class FlowRunner {
 public:
  virtual ~FlowRunner() = default;

  virtual urn::Urn Start(const std::string& flow_name, const urn::Urn& target) = 0;

  virtual FlowStatus Status(const urn::Urn& flow) = 0;
};

} // namespace aff4::flow

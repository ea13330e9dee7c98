#pragma once

#include <memory>

#include "schema_registry.hpp"

namespace aff4::schema {

/*
  Built-in object kinds and their attribute names.
*/

namespace kinds {
inline constexpr const char* kObject = "AFF4Object";
inline constexpr const char* kFile   = "VFSFile";
inline constexpr const char* kClient = "VFSGRRClient";
inline constexpr const char* kFlow   = "Flow";
} // namespace kinds

namespace attrs {
// AFF4Object
inline constexpr const char* kType = "aff4:type";

// VFSFile
inline constexpr const char* kStat         = "aff4:stat";
inline constexpr const char* kContent      = "aff4:content";
inline constexpr const char* kSize         = "aff4:size";
inline constexpr const char* kContentLast  = "aff4:content_last";
inline constexpr const char* kContentLock  = "aff4:content_lock";
inline constexpr const char* kPathspec     = "aff4:pathspec";

// VFSGRRClient
inline constexpr const char* kHostname       = "metadata:hostname";
inline constexpr const char* kFqdn           = "metadata:fqdn";
inline constexpr const char* kSystem         = "metadata:system";
inline constexpr const char* kOsRelease      = "metadata:os_release";
inline constexpr const char* kKernel         = "metadata:kernel_version";
inline constexpr const char* kArch           = "metadata:architecture";
inline constexpr const char* kInstallDate    = "metadata:install_date";
inline constexpr const char* kKnowledgeBase  = "metadata:knowledge_base";
inline constexpr const char* kUsernames      = "metadata:usernames";
inline constexpr const char* kLastInterfaces = "aff4:last_interfaces";
inline constexpr const char* kClientInfo     = "metadata:client_info";
inline constexpr const char* kFirstSeen      = "metadata:first_seen";

// Flow
inline constexpr const char* kFlowName   = "aff4:flow_name";
inline constexpr const char* kFlowState  = "aff4:flow_state";
inline constexpr const char* kFlowTarget = "aff4:flow_target";
inline constexpr const char* kFlowError  = "aff4:flow_error";
} // namespace attrs

void RegisterDefaultKinds(SchemaRegistry& registry);

std::shared_ptr<const SchemaRegistry> DefaultRegistry();

} // namespace aff4::schema

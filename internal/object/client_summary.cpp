#include "client_summary.hpp"

#include <algorithm>
#include <optional>

#include "internal/schema/default_schema.hpp"

namespace aff4::object {

namespace {

constexpr const char* kSummaryAttributes[] = {
    schema::attrs::kHostname,      schema::attrs::kSystem,    schema::attrs::kOsRelease,      schema::attrs::kKernel,
    schema::attrs::kFqdn,          schema::attrs::kArch,      schema::attrs::kInstallDate,    schema::attrs::kKnowledgeBase,
    schema::attrs::kUsernames,     schema::attrs::kClientInfo, schema::attrs::kLastInterfaces,
};

} // namespace

v1::ClientSummary SummarizeClient(const Object& client) {
  v1::ClientSummary summary;
  summary.set_client_id(client.Urn().RootId());

  auto* uname = summary.mutable_system_info();
  uname->set_node(client.GetString(schema::attrs::kHostname));
  uname->set_system(client.GetString(schema::attrs::kSystem));
  uname->set_release(client.GetString(schema::attrs::kOsRelease));
  uname->set_kernel(client.GetString(schema::attrs::kKernel));
  uname->set_fqdn(client.GetString(schema::attrs::kFqdn));
  uname->set_machine(client.GetString(schema::attrs::kArch));
  uname->set_install_date(client.GetTimestamp(schema::attrs::kInstallDate));

  if (auto kb = client.GetMessage<v1::KnowledgeBase>(schema::attrs::kKnowledgeBase)) {
    *summary.mutable_users() = kb->users();
  }
  // older clients only report bare account names
  if (summary.users().empty()) {
    for (const auto& name : client.GetSequence(schema::attrs::kUsernames)) {
      summary.add_users()->set_username(name.string_value());
    }
  }
  for (auto& iface : client.GetMessageSequence<v1::Interface>(schema::attrs::kLastInterfaces)) {
    *summary.add_interfaces() = std::move(iface);
  }
  if (auto info = client.GetMessage<v1::ClientInformation>(schema::attrs::kClientInfo)) {
    *summary.mutable_client_info() = std::move(*info);
  }

  std::optional<util::Timestamp> newest;
  for (const char* attribute : kSummaryAttributes) {
    if (auto age = client.AttributeAge(attribute)) {
      newest = std::max(newest.value_or(0), *age);
    }
  }
  summary.set_timestamp(newest.value_or(client.OpenedAt()));
  return summary;
}

} // namespace aff4::object

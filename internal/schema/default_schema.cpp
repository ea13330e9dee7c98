#include "default_schema.hpp"

#include "aff4/store/v1.hpp"
#include "values.hpp"

namespace aff4::schema {

namespace {

AttributeDescriptor Single(const char* name, ValueType type, std::string description) {
  AttributeDescriptor d;
  d.name        = name;
  d.type        = type;
  d.description = std::move(description);
  return d;
}

AttributeDescriptor MessageOf(const char* name, const google::protobuf::Descriptor* message, std::string description) {
  AttributeDescriptor d = Single(name, ValueType::kMessage, std::move(description));
  d.message_type        = message->full_name();
  return d;
}

AttributeDescriptor Sequence(AttributeDescriptor d) {
  d.multiplicity = Multiplicity::kSequence;
  return d;
}

} // namespace

void RegisterDefaultKinds(SchemaRegistry& registry) {
  using namespace aff4::store::v1;

  registry.RegisterKind(kinds::kObject, "",
                        {
                            Single(attrs::kType, ValueType::kString, "Object kind recorded at creation."),
                        });

  auto size          = Single(attrs::kSize, ValueType::kInteger, "Content length in bytes.");
  size.default_value = values::Integer(0);

  auto content_last   = Single(attrs::kContentLast, ValueType::kTimestamp, "When the content last changed.");
  content_last.tracks = attrs::kContent;

  registry.RegisterKind(kinds::kFile, kinds::kObject,
                        {
                            MessageOf(attrs::kStat, StatEntry::descriptor(), "Stat entry reported by the client."),
                            Single(attrs::kContent, ValueType::kBytes, "Mirrored file content."),
                            std::move(size),
                            std::move(content_last),
                            Single(attrs::kContentLock, ValueType::kUrn, "Flow currently collecting the content."),
                            MessageOf(attrs::kPathspec, PathSpec::descriptor(), "Pathspec the file was collected from."),
                        });

  registry.RegisterKind(kinds::kClient, kinds::kObject,
                        {
                            Single(attrs::kHostname, ValueType::kString, "Hostname of the host."),
                            Single(attrs::kFqdn, ValueType::kString, "Fully qualified hostname."),
                            Single(attrs::kSystem, ValueType::kString, "Operating system family."),
                            Single(attrs::kOsRelease, ValueType::kString, "Operating system release."),
                            Single(attrs::kKernel, ValueType::kString, "Kernel version string."),
                            Single(attrs::kArch, ValueType::kString, "Machine architecture."),
                            Single(attrs::kInstallDate, ValueType::kTimestamp, "Operating system install date."),
                            MessageOf(attrs::kKnowledgeBase, KnowledgeBase::descriptor(), "Host knowledge base."),
                            Sequence(Single(attrs::kUsernames, ValueType::kString, "Account names seen on the host.")),
                            Sequence(MessageOf(attrs::kLastInterfaces, Interface::descriptor(), "Network interfaces.")),
                            MessageOf(attrs::kClientInfo, ClientInformation::descriptor(), "Client software metadata."),
                            Single(attrs::kFirstSeen, ValueType::kTimestamp, "First contact with the client."),
                        });

  registry.RegisterKind(kinds::kFlow, kinds::kObject,
                        {
                            Single(attrs::kFlowName, ValueType::kString, "Flow implementation name."),
                            Single(attrs::kFlowState, ValueType::kString, "RUNNING, FINISHED or ERROR."),
                            Single(attrs::kFlowTarget, ValueType::kUrn, "Object the flow works on."),
                            Single(attrs::kFlowError, ValueType::kString, "Failure reason of an errored flow."),
                        });
}

std::shared_ptr<const SchemaRegistry> DefaultRegistry() {
  auto registry = std::make_shared<SchemaRegistry>();
  RegisterDefaultKinds(*registry);
  return registry;
}

} // namespace aff4::schema

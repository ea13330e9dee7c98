#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "aff4/store/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/object/vfs_file.hpp"
#include "internal/object/vfs_grr_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/urn/pathspec_mapper.hpp"

using aff4::store::v1::AttributeValue;
using aff4::store::v1::PathSpec;

static void Usage() {
  std::cout << "Usage:\n"
            << "  aff4ctl --config <config.yaml> ls <urn>\n"
            << "  aff4ctl --config <config.yaml> get <urn> <attribute> [--history]\n"
            << "  aff4ctl --config <config.yaml> summary <client-id>\n"
            << "  aff4ctl --config <config.yaml> urn <client-id> <pathtype>:<path> [<pathtype>:<path>...]\n"
            << "  aff4ctl --config <config.yaml> update <file-urn>\n"
            << "  aff4ctl --config <config.yaml> flows <client-id>\n"
            << "  aff4ctl --config <config.yaml> finish <flow-urn>\n"
            << "  aff4ctl --config <config.yaml> fail <flow-urn> <reason>\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                                 out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    return "<" + std::string(status.message()) + ">";
  }
  return out;
}

static std::optional<PathSpec::PathType> ParsePathType(const std::string& value) {
  if (value == "os") return PathSpec::OS;
  if (value == "tsk") return PathSpec::TSK;
  if (value == "registry") return PathSpec::REGISTRY;
  if (value == "memory") return PathSpec::MEMORY;
  if (value == "temp") return PathSpec::TMPFILE;
  return std::nullopt;
}

static void PrintValue(const AttributeValue& value) {
  switch (value.kind_case()) {
    case AttributeValue::kStringValue:
      std::cout << value.string_value();
      break;
    case AttributeValue::kIntegerValue:
      std::cout << value.integer_value();
      break;
    case AttributeValue::kTimestampValue:
      std::cout << value.timestamp_value();
      break;
    case AttributeValue::kBytesValue:
      std::cout << value.bytes_value().size() << " bytes";
      break;
    case AttributeValue::kUrnValue:
      std::cout << value.urn_value();
      break;
    default:
      std::cout << ToJson(value);
      break;
  }
}

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  const std::string arg         = argv[4];

  try {
    auto config = aff4::config::ConfigLoader::LoadFromYaml(config_path);
    aff4::observability::InitializeLogging(config);

    auto deps = aff4::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "ls") {
      for (const auto& child : deps.objects->ListChildren(arg)) {
        std::cout << child.Value() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 6) {
        Usage();
        return 1;
      }
      const std::string attribute = argv[5];
      auto              handle    = deps.objects->Open(arg);

      if (argc >= 7 && std::string(argv[6]) == "--history") {
        for (const auto& version : handle->GetHistory(attribute)) {
          std::cout << version.timestamp << " ";
          PrintValue(version.value);
          std::cout << "\n";
        }
        return 0;
      }

      auto value = handle->Get(attribute);
      if (!value) {
        std::cerr << attribute << " is not set\n";
        return 2;
      }
      PrintValue(*value);
      std::cout << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "summary") {
      auto client = deps.objects->Open<aff4::object::VfsGrrClient>(arg);
      std::cout << ToJson(client->GetSummary());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "urn") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      PathSpec pathspec;
      bool     first = true;
      for (int i = 5; i < argc; ++i) {
        const std::string segment = argv[i];
        const auto        colon   = segment.find(':');
        auto              type    = colon == std::string::npos ? std::nullopt : ParsePathType(segment.substr(0, colon));
        if (!type) {
          std::cerr << "invalid pathspec segment: " << segment << "\n";
          return 1;
        }

        PathSpec next;
        next.set_pathtype(*type);
        next.set_path(segment.substr(colon + 1));
        if (first) {
          pathspec = next;
          first    = false;
        } else {
          aff4::urn::AppendPathspec(pathspec, next);
        }
      }

      std::cout << aff4::urn::PathspecToUrn(pathspec, arg).Value() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "update") {
      auto file = deps.objects->Open<aff4::object::VfsFile>(arg, aff4::object::Mode::kReadWrite);
      std::cout << file->Update().Value() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "flows") {
      for (const auto& flow : deps.flows->ListFlows(arg)) {
        std::cout << flow.Value() << " " << deps.flows->FlowName(flow) << " " << aff4::flow::ToString(deps.flows->Status(flow)) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "finish") {
      deps.flows->Finish(arg);
      std::cout << "finished\n";
      return 0;
    }

    if (cmd == "fail") {
      if (argc < 6) {
        Usage();
        return 1;
      }
      deps.flows->Fail(arg, argv[5]);
      std::cout << "failed\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    aff4::observability::ShutdownLogging();
    return 2;
  }

  Usage();
  return 1;
}

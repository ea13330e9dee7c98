#include <iostream>
#include <string>

#include "aff4/store/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/object/vfs_file.hpp"
#include "internal/object/vfs_grr_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/schema/values.hpp"

namespace attrs  = aff4::schema::attrs;
namespace values = aff4::schema::values;

int main(int argc, char** argv) {
  // Optional config file; defaults to an in-memory repository.
  auto config = argc > 1 ? aff4::config::ConfigLoader::LoadFromYaml(argv[1]) : aff4::config::ConfigLoader::LoadFromYamlString("");
  aff4::observability::InitializeLogging(config);

  auto deps = aff4::factory::Build(config);

  // Record what the endpoint reported about itself.
  {
    auto client = deps.objects->Create<aff4::object::VfsGrrClient>("C.1000000000000001");
    client->Set(attrs::kHostname, values::String("workstation"));
    client->Set(attrs::kSystem, values::String("Linux"));
    client->Set(attrs::kOsRelease, values::String("22.04"));
    client->Set(attrs::kUsernames, values::StringList({"alice", "bob"}));
    client->Close();
  }

  // Mirror one file collected through the raw filesystem parser.
  aff4::store::v1::PathSpec pathspec;
  pathspec.set_pathtype(aff4::store::v1::PathSpec::OS);
  pathspec.set_path("/dev/sda1");
  pathspec.mutable_nested_path()->set_pathtype(aff4::store::v1::PathSpec::TSK);
  pathspec.mutable_nested_path()->set_path("/etc/hostname");

  auto client    = deps.objects->Open<aff4::object::VfsGrrClient>("C.1000000000000001");
  auto file_urn  = client->PathspecToUrn(pathspec);
  auto file      = deps.objects->Create<aff4::object::VfsFile>(file_urn);
  file->Set(attrs::kPathspec, values::Message(pathspec));
  file->Write("workstation\n");
  file->Close();

  // Ask for fresh content; a second call reuses the running flow.
  auto first  = file->Update();
  auto second = file->Update();
  std::cout << "file:    " << file_urn.Value() << "\n"
            << "flow:    " << first.Value() << (first == second ? " (reused)" : "") << "\n"
            << "size:    " << file->Size() << "\n"
            << "content: " << file->ContentAge() << "\n";

  auto summary = client->GetSummary();
  std::cout << "client:  " << summary.client_id() << " " << summary.system_info().node() << " " << summary.system_info().system() << "\n";

  aff4::observability::ShutdownLogging();
  return 0;
}

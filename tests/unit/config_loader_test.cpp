#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "epg_guide_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& path) {
  try {
    (void)epg::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\epg\\\"quoted\"\\guide.db"
    wal_mode: true
feed:
  url: "file:///tmp/guide.xml"
)");

  auto config = epg::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\epg\\\"quoted\"\\guide.db");
  assert(config.database().sqlite().wal_mode());
}

void TestDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(feed:
  url: "http://provider.example/xmltv.php"
)");

  auto config = epg::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.feed().user_agent() == "epg-guide/1.0");
  assert(config.feed().connect_timeout().seconds() == 10);
  assert(config.sync().batch_size() == 100);
  assert(config.sync().retention().seconds() == 86400);
  assert(config.sync().denylist_size() == 3);
  assert(config.sync().denylist(0) == "Adult");
  assert(config.sync().interval().seconds() == 0);
  assert(config.sync().initial_backoff().seconds() == 30);
  assert(config.sync().max_backoff().seconds() == 3600);
  assert(!config.sync().run_on_start());
}

void TestExplicitSyncSettings() {
  const auto yaml_path = WriteYaml("sync_settings",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
feed:
  url: "/srv/guide.xml.gz"
  connect_timeout: "3s"
sync:
  batch_size: 250
  retention: "172800s"
  denylist: ["Shopping"]
  interval: "3600s"
  initial_backoff: "5s"
  max_backoff: "60s"
  run_on_start: true
logging:
  level: "debug"
)");

  auto config = epg::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.feed().connect_timeout().seconds() == 3);
  assert(config.sync().batch_size() == 250);
  assert(config.sync().retention().seconds() == 172800);
  assert(config.sync().denylist_size() == 1);
  assert(config.sync().denylist(0) == "Shopping");
  assert(config.sync().interval().seconds() == 3600);
  assert(config.sync().run_on_start());
  assert(config.logging().level() == "debug");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(feed:
  url: "file:///tmp/guide.xml"
unknown_field: 123
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingFeedUrlIsRejected() {
  const auto yaml_path = WriteYaml("missing_feed",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
)");

  assert(Rejects(yaml_path));
}

void TestBackoffOrderingIsValidated() {
  const auto yaml_path = WriteYaml("bad_backoff",
                                   R"(feed:
  url: "file:///tmp/guide.xml"
sync:
  initial_backoff: "120s"
  max_backoff: "60s"
)");

  assert(Rejects(yaml_path));
}

void TestMissingFileIsRejected() {
  assert(Rejects(std::filesystem::temp_directory_path() / "epg_guide_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestDefaultsAreApplied();
  TestExplicitSyncSettings();
  TestUnknownFieldsAreRejected();
  TestMissingFeedUrlIsRejected();
  TestBackoffOrderingIsValidated();
  TestMissingFileIsRejected();

  std::cout << "epg_guide_unit_config_loader: pass\n";
  return 0;
}

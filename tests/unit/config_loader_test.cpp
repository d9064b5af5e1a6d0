#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fleetwatch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)fleetwatch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const fleetwatch::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(inventory:
  static_list:
    devices:
      - id: "1"
        address: "10.0.0.1"
)");

  auto config = fleetwatch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(fleetwatch::util::FromProto(config.polling().interval()) == 5s);
  assert(fleetwatch::util::FromProto(config.polling().probe_timeout()) == 3s);
  assert(config.polling().max_concurrency() == 20);
  assert(config.polling().autostart());
  assert(config.store().output_dir() == "ping_results");
  assert(config.store().retention_days() == 30);
  assert(config.tracking().enabled());
  assert(config.tracking().state_file() == "timeout_tracking.csv");
  assert(config.alerting().enabled());
  assert(config.alerting().threshold() == 5);
  assert(fleetwatch::util::FromProto(config.alerting().cooldown()) == 3600s);
  assert(config.alerting().has_log());
  assert(config.logging().level() == "info");
  assert(config.inventory().static_list().devices_size() == 1);
}

void TestExplicitValuesOverrideDefaults() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(polling:
  interval: "30s"
  probe_timeout: "1.5s"
  max_concurrency: 50
  autostart: false
store:
  output_dir: "/var/lib/fleetwatch"
  retention_days: 0
tracking:
  enabled: false
alerting:
  enabled: true
  threshold: 3
  cooldown: "600s"
  recipients: ["6281100000000", "6281100000001"]
  webhook:
    url: "http://gateway.local/api/send_message"
    recipient_field: "phone_no"
    static_fields:
      api_key: "k"
inventory:
  sqlite:
    path: "/data/inventaris.db"
)");

  auto config = fleetwatch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(fleetwatch::util::FromProto(config.polling().interval()) == 30s);
  assert(fleetwatch::util::FromProto(config.polling().probe_timeout()) == 1500ms);
  assert(config.polling().max_concurrency() == 50);
  assert(!config.polling().autostart());
  assert(config.store().retention_days() == 0);
  assert(!config.tracking().enabled());
  assert(config.alerting().threshold() == 3);
  assert(config.alerting().recipients_size() == 2);
  assert(config.alerting().webhook().recipient_field() == "phone_no");
  assert(config.alerting().webhook().message_field() == "message");
  assert(fleetwatch::util::FromProto(config.alerting().webhook().timeout()) == 10s);
  assert(config.alerting().webhook().static_fields().at("api_key") == "k");
  assert(config.inventory().sqlite().path() == "/data/inventaris.db");
}

void TestQuotedNumericScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(inventory:
  static_list:
    devices:
      - id: "017"
        address: "10.0.0.17"
        hostname: "C:\\lab\\\"pc\""
)");

  auto        config = fleetwatch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto& device = config.inventory().static_list().devices(0);
  assert(device.id() == "017");
  assert(device.hostname() == "C:\\lab\\\"pc\"");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", R"(unknown_field: 123
inventory:
  static_list: {}
)") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("zero_interval", R"(polling:
  interval: "0s"
inventory:
  static_list: {}
)"));

  assert(Rejects("negative_timeout", R"(polling:
  probe_timeout: "-1s"
inventory:
  static_list: {}
)"));

  assert(Rejects("negative_concurrency", R"(polling:
  max_concurrency: -4
inventory:
  static_list: {}
)"));

  assert(Rejects("huge_concurrency", R"(polling:
  max_concurrency: 100000
inventory:
  static_list: {}
)"));

  assert(Rejects("nested_state_file", R"(tracking:
  state_file: "../state.csv"
inventory:
  static_list: {}
)"));

  assert(Rejects("webhook_without_recipients", R"(alerting:
  webhook:
    url: "http://gateway.local/send"
inventory:
  static_list: {}
)"));

  assert(Rejects("missing_inventory", R"(polling:
  interval: "5s"
)"));

  assert(Rejects("unknown_level", R"(logging:
  level: "loud"
inventory:
  static_list: {}
)"));

  assert(Rejects("unknown_alert_log_level", R"(alerting:
  log:
    level: "warnn"
inventory:
  static_list: {}
)"));
}

void TestAlertLogLevelAccepted() {
  const auto path   = WriteYaml("alert_log_level", R"(alerting:
  log:
    level: "error"
inventory:
  static_list: {}
)");
  const auto config = fleetwatch::config::ConfigLoader::LoadFromYaml(path.string());
  assert(config.alerting().has_log());
  assert(config.alerting().log().level() == "error");
}

void TestMissingFileIsInvalidConfig() {
  bool threw = false;
  try {
    (void)fleetwatch::config::ConfigLoader::LoadFromYaml("/nonexistent/fleetwatch.yaml");
  } catch (const fleetwatch::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestExplicitValuesOverrideDefaults();
  TestQuotedNumericScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestAlertLogLevelAccepted();
  TestMissingFileIsInvalidConfig();

  std::cout << "fleetwatch_unit_config_loader: pass\n";
  return 0;
}

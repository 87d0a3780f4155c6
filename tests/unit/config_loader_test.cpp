#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using resync::config::ConfigLoader;
using resync::util::ConfigError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "resync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\resync\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\resync\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(locks:
  managers:
    - employee_id: "1001"
      pin: "0042"
)");
  assert(config.locks().managers_size() == 1);
  assert(config.locks().managers(0).employee_id() == "1001");
  assert(config.locks().managers(0).pin() == "0042");
}

void TestDefaultsAreApplied() {
  auto config = ConfigLoader::LoadFromString(R"(node:
  node_id: terminal-07
properties:
  - id: downtown
)");

  assert(config.node().role() == resync::runtime::config::NODE_ROLE_TERMINAL);
  assert(config.database().has_memory());
  assert(config.connectivity().missed_heartbeat_threshold() == 3);
  assert(config.fiscal().tick_interval_ms() == 60000);
  assert(config.replay().batch_size() == 10);
  assert(config.recovery().max_recovery_attempts() == 3);
  assert(config.recovery().recovery_backoff_ms() == 1000);
  assert(config.recovery().auto_recovery_enabled());
  assert(config.locks().flush_timeout_ms() == 5000);

  const auto& property = config.properties(0);
  assert(property.timezone() == "America/New_York");
  assert(property.rollover_time() == "04:00");
  assert(property.rollover_mode() == "auto");
}

void TestExplicitFalseAutoRecoveryIsKept() {
  auto config = ConfigLoader::LoadFromString(R"(recovery:
  auto_recovery_enabled: false
)");
  assert(!config.recovery().auto_recovery_enabled());
}

void TestPropertyMapping() {
  auto config = ConfigLoader::LoadFromString(R"(properties:
  - id: airport
    timezone: America/Chicago
    rollover_time: "22:00"
    rollover_mode: manual
    allow_pm_rollover: true
    auto_clock_out: true
)");

  const auto record = resync::config::PropertyFromConfig(config.properties(0));
  assert(record.id == "airport");
  assert(record.name == "airport");
  assert(record.rollover_mode == resync::v1::ROLLOVER_MODE_MANUAL);
  assert(record.allow_pm_rollover);
  assert(record.auto_clock_out);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)"));
}

void TestInvalidPropertiesAreRejectedAtLoad() {
  assert(Rejects(R"(properties:
  - id: downtown
    rollover_time: "25:00"
)"));
  assert(Rejects(R"(properties:
  - id: downtown
    rollover_time: "22:00"
)"));
  assert(Rejects(R"(properties:
  - id: downtown
    timezone: Not/AZone
)"));
  assert(Rejects(R"(properties:
  - id: downtown
    rollover_mode: sometimes
)"));
  assert(Rejects(R"(properties:
  - id: downtown
  - id: downtown
)"));
}

void TestInvalidInfrastructureIsRejected() {
  assert(Rejects(R"(database:
  sqlite:
    wal_mode: true
)"));
  assert(Rejects(R"(locks:
  managers:
    - employee_id: mgr-1
)"));
  assert(Rejects(R"(connectivity:
  peripherals:
    - name: printer
      address: 10.0.0.40:9100
    - name: printer
      address: 10.0.0.41:9100
)"));
}

void TestRecoveryAttemptsAreBounded() {
  assert(Rejects(R"(recovery:
  max_recovery_attempts: 64
)"));
  const auto config = ConfigLoader::LoadFromString(R"(recovery:
  max_recovery_attempts: 16
)");
  assert(config.recovery().max_recovery_attempts() == 16);
}

void TestMissingFileIsConfigError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/resync.yaml");
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDefaultsAreApplied();
  TestExplicitFalseAutoRecoveryIsKept();
  TestPropertyMapping();
  TestUnknownFieldsAreRejected();
  TestInvalidPropertiesAreRejectedAtLoad();
  TestInvalidInfrastructureIsRejected();
  TestRecoveryAttemptsAreBounded();
  TestMissingFileIsConfigError();

  std::cout << "resync_unit_config_loader: pass\n";
  return 0;
}

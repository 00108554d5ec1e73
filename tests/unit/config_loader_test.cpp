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

using healthd::config::ConfigLoader;
using healthd::util::FromProto;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "healthd_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(state:
  path: "/var/lib/healthd/state.db"
  compact_period: "3600s"
events:
  retention_period: "86400s"
metrics:
  enabled: true
  scrape_interval: "30s"
  purge_interval: "600s"
  retain_duration: "7200s"
logging:
  level: "debug"
observability:
  metrics_enabled: false
  otlp_endpoint: "localhost:4317"
  transport: "OTLP_TRANSPORT_HTTP"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.state().path() == "/var/lib/healthd/state.db");
  assert(FromProto(config.state().compact_period()) == std::chrono::hours(1));
  assert(FromProto(config.events().retention_period()) == std::chrono::hours(24));
  assert(config.metrics().enabled());
  assert(FromProto(config.metrics().scrape_interval()) == std::chrono::seconds(30));
  assert(FromProto(config.metrics().purge_interval()) == std::chrono::minutes(10));
  assert(FromProto(config.metrics().retain_duration()) == std::chrono::hours(2));
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == healthd::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestDefaultsApplied() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(state:
  path: "/tmp/healthd.db"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(FromProto(config.events().retention_period()) == std::chrono::hours(72));
  assert(FromProto(config.metrics().scrape_interval()) == std::chrono::minutes(1));
  assert(FromProto(config.metrics().purge_interval()) == std::chrono::minutes(5));
  assert(FromProto(config.metrics().retain_duration()) == std::chrono::hours(72));
  assert(FromProto(config.state().compact_period()) == std::chrono::nanoseconds::zero());
  assert(!config.metrics().enabled());
}

void TestRetainDurationFollowsRetention() {
  const auto yaml_path = WriteYaml("retain_follows",
                                   R"(state:
  path: "/tmp/healthd.db"
events:
  retention_period: "7200s"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(FromProto(config.metrics().retain_duration()) == std::chrono::hours(2));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(state:
  path: "/tmp/healthd.db"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestShortRetentionIsRejected() {
  const auto yaml_path = WriteYaml("short_retention",
                                   R"(state:
  path: "/tmp/healthd.db"
events:
  retention_period: "30s"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const healthd::util::InvalidArgument& e) {
    threw = true;
    assert(std::string(e.what()).find("retention_period") != std::string::npos);
  }
  assert(threw);
}

void TestMissingStatePathIsRejected() {
  const auto yaml_path = WriteYaml("missing_path",
                                   R"(events:
  retention_period: "3600s"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const healthd::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNegativeCompactPeriodIsRejected() {
  const auto yaml_path = WriteYaml("negative_compact",
                                   R"(state:
  path: "/tmp/healthd.db"
  compact_period: "-5s"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const healthd::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestOversizedDurationIsRejected() {
  const auto yaml_path = WriteYaml("oversized_retention",
                                   R"(state:
  path: "/tmp/healthd.db"
events:
  retention_period: "10000000000s"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const healthd::util::InvalidArgument& e) {
    threw = true;
    assert(std::string(e.what()).find("events.retention_period is out of range") != std::string::npos);
  }
  assert(threw);

  // the largest value that still fits is accepted
  const auto max_path = WriteYaml("max_retention",
                                  R"(state:
  path: "/tmp/healthd.db"
events:
  retention_period: "9223372035s"
)");
  auto config = ConfigLoader::LoadFromYaml(max_path.string());
  assert(FromProto(config.events().retention_period()) == std::chrono::seconds(9223372035));
  assert(FromProto(config.metrics().retain_duration()) == std::chrono::seconds(9223372035));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/healthd/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(std::string(e.what()).find("Failed to load YAML config") != std::string::npos);
  }
  assert(threw);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(state:
  path: "12345"
logging:
  level: "true"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.state().path() == "12345");
  assert(config.logging().level() == "true");
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsApplied();
  TestRetainDurationFollowsRetention();
  TestUnknownFieldsAreRejected();
  TestShortRetentionIsRejected();
  TestMissingStatePathIsRejected();
  TestNegativeCompactPeriodIsRejected();
  TestOversizedDurationIsRejected();
  TestMissingFileIsReported();
  TestQuotedScalarsStayStrings();

  std::cout << "healthd_unit_config_loader: pass" << std::endl;
  return 0;
}

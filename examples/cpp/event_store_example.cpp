#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/time.hpp"

namespace {

healthd::runtime::config::RuntimeConfig DefaultConfig() {
  healthd::runtime::config::RuntimeConfig config;
  config.mutable_state()->set_path((std::filesystem::temp_directory_path() / "healthd_example.db").string());
  healthd::config::ConfigLoader::ApplyDefaults(&config);
  return config;
}

std::string Describe(const healthd::model::Event& event) {
  std::string out = std::to_string(event.time.time_since_epoch().count()) + " " + event.name + " [" +
                    std::string(healthd::model::EventTypeName(event.type)) + "]";
  if (!event.message.empty()) {
    out += " " + event.message;
  }
  if (event.extra_info) {
    for (const auto& [key, value] : *event.extra_info) {
      out += " " + key + "=" + value;
    }
  }
  return out;
}

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config path; otherwise a throwaway database under the temp dir.
  const auto config = argc > 1 ? healthd::config::ConfigLoader::LoadFromYaml(argv[1]) : DefaultConfig();

  healthd::observability::InitializeLogging(config);
  healthd::observability::InitializeMetrics(config);

  try {
    auto deps   = healthd::factory::BuildRuntime(config);
    auto bucket = deps.event_store->OpenBucket("accelerator-nvidia-error-xid");
    auto ctx    = healthd::util::Context::Background().WithTimeout(std::chrono::seconds(30));

    healthd::model::Event event;
    event.time       = std::chrono::floor<std::chrono::seconds>(healthd::util::Now());
    event.name       = "error_xid";
    event.type       = healthd::model::EventType::kCritical;
    event.message    = "XID 79 detected on GPU 0";
    event.extra_info = healthd::model::ExtraInfo{{"xid", "79"}, {"device", "gpu-0"}};
    event.suggested_actions.emplace();
    event.suggested_actions->add_descriptions("GPU has fallen off the bus");
    event.suggested_actions->add_repair_actions(healthd::v1::REPAIR_ACTION_TYPE_REBOOT_SYSTEM);

    // Find-then-insert keeps a re-scanned log line from being stored twice.
    for (int attempt = 0; attempt < 2; ++attempt) {
      if (bucket->Find(ctx, event)) {
        std::cout << "already recorded, skipping insert\n";
        continue;
      }
      bucket->Insert(ctx, event);
      std::cout << "inserted into " << bucket->Name() << '\n';
    }

    const auto since  = std::chrono::floor<std::chrono::seconds>(healthd::util::Now() - std::chrono::hours(1));
    auto       events = bucket->Get(ctx, since);
    if (!events) {
      std::cout << "no events in the last hour\n";
    } else {
      for (const auto& e : *events) {
        std::cout << Describe(e) << '\n';
      }
    }

    if (auto latest = bucket->Latest(ctx)) {
      std::cout << "latest: " << Describe(*latest) << '\n';
    }

    const auto purged = bucket->Purge(ctx, healthd::util::ToUnixSeconds(healthd::util::Now() - std::chrono::hours(72)));
    std::cout << "purged " << purged << " expired events\n";

    bucket->Close();
    deps.compactor->Stop();
  } catch (const std::exception& e) {
    std::cerr << "event store example failed: " << e.what() << '\n';
    healthd::observability::ShutdownMetrics();
    healthd::observability::ShutdownLogging();
    return 1;
  }

  healthd::observability::ShutdownMetrics();
  healthd::observability::ShutdownLogging();
  return 0;
}

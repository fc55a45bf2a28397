#include "sinks/ui_sink.hpp"

#include <cstdio>
#include <mutex>

namespace netmon_agent::sinks {
namespace {

class NullUiSink final : public UiSink {
 public:
  void update_connection(bool, const std::optional<std::string>&, const std::optional<std::string>&) override {}
  void update_segments(const std::vector<SegmentView>&) override {}
  void update_devices(const std::vector<model::DeviceInfo>&) override {}
  void update_device_status(const std::string&, model::DeviceStatus, std::optional<double>) override {}
  void update_segment_scanning(const std::string&, bool) override {}
  void update_version_info(const std::optional<std::string>&, bool) override {}
  void add_log(core::LogLevel, const std::string&) override {}
};

class StdoutUiSink final : public UiSink {
 public:
  void update_connection(const bool connected, const std::optional<std::string>& agent_id,
                         const std::optional<std::string>& organization_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[ui] connection=%s agent=%s org=%s\n", connected ? "up" : "down", agent_id.value_or("-").c_str(),
                organization_id.value_or("-").c_str());
    std::fflush(stdout);
  }

  void update_segments(const std::vector<SegmentView>& segments) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& segment : segments) {
      std::printf("[ui] segment id=%s name=\"%s\" cidr=%s devices=%zu scanning=%d last_scan=%s\n", segment.id.c_str(),
                  segment.name.c_str(), segment.cidr.c_str(), segment.device_count, segment.scanning ? 1 : 0,
                  segment.last_scan.value_or("never").c_str());
    }
    std::fflush(stdout);
  }

  void update_devices(const std::vector<model::DeviceInfo>& devices) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[ui] devices count=%zu\n", devices.size());
    std::fflush(stdout);
  }

  void update_device_status(const std::string& ip, const model::DeviceStatus status,
                            const std::optional<double> response_time_ms) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (response_time_ms.has_value()) {
      std::printf("[ui] device %s status=%s rtt_ms=%.2f\n", ip.c_str(), model::to_string(status), *response_time_ms);
    } else {
      std::printf("[ui] device %s status=%s\n", ip.c_str(), model::to_string(status));
    }
    std::fflush(stdout);
  }

  void update_segment_scanning(const std::string& segment_id, const bool scanning) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[ui] segment %s scanning=%d\n", segment_id.c_str(), scanning ? 1 : 0);
    std::fflush(stdout);
  }

  void update_version_info(const std::optional<std::string>& latest_version, const bool upgrade_available) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[ui] version latest=%s upgrade_available=%d\n", latest_version.value_or("-").c_str(),
                upgrade_available ? 1 : 0);
    std::fflush(stdout);
  }

  void add_log(const core::LogLevel level, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[ui] %s %s\n", core::to_string(level), message.c_str());
    std::fflush(stdout);
  }

 private:
  std::mutex mutex_{};
};

}  // namespace

std::unique_ptr<UiSink> make_null_ui_sink() { return std::make_unique<NullUiSink>(); }

std::unique_ptr<UiSink> make_stdout_ui_sink() { return std::make_unique<StdoutUiSink>(); }

}  // namespace netmon_agent::sinks

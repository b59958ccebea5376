#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "chunkcam_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsMapped() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
device:
  device_id: "cam-042"
  recordings_dir: /data/chunks
database:
  sqlite:
    path: "/data/chunkcam.db"
    wal_mode: false
upload:
  endpoint: "ingest.example.net:443"
  auth_token: "secret"
  use_tls: true
  frame_bytes: 65536
capture:
  ffmpeg_path: /usr/bin/ffmpeg
  video_device: /dev/video2
  audio_device: "hw:1,0"
janitor:
  interval_seconds: 60
)");

  auto config = chunkcam::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.device().device_id() == "cam-042");
  assert(config.device().recordings_dir() == "/data/chunks");
  assert(config.database().sqlite().path() == "/data/chunkcam.db");
  assert(!config.database().sqlite().wal_mode());
  assert(config.upload().endpoint() == "ingest.example.net:443");
  assert(config.upload().use_tls());
  assert(config.upload().frame_bytes() == 65536);
  assert(config.capture().video_device() == "/dev/video2");
  assert(config.capture().audio_device() == "hw:1,0");
  assert(config.janitor().interval_seconds() == 60);

  // filled in by defaults
  assert(config.capture().extension() == "mp4");
  assert(config.capture().staging_dir() == "/data/chunks/.staging");
}

void TestDefaultsForMinimalConfig() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(upload:
  endpoint: "localhost:50051"
)");

  auto config = chunkcam::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.device().recordings_dir() == "/var/lib/chunkcam/recordings");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.upload().frame_bytes() == 256 * 1024);
  assert(config.capture().ffmpeg_path() == "ffmpeg");
  assert(config.capture().video_device() == "/dev/video0");
  assert(config.janitor().interval_seconds() == 300);
}

void TestEmptyMemorySectionSelectsMemoryBackend() {
  const auto yaml_path = WriteYaml("memory_backend",
                                   R"(database:
  memory:
upload:
  endpoint: "localhost:50051"
)");

  auto config = chunkcam::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(device:
  device_id: "12345"
upload:
  endpoint: "line1\nline2☃"
)");

  auto config = chunkcam::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.device().device_id() == "12345");
  assert(config.upload().endpoint() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(upload:
  endpoint: "localhost:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)chunkcam::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)chunkcam::config::ConfigLoader::LoadFromYaml("/nonexistent/chunkcam.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsMapped();
  TestDefaultsForMinimalConfig();
  TestEmptyMemorySectionSelectsMemoryBackend();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "chunkcam_unit_config_loader: pass\n";
  return 0;
}

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/upload_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/instance_lock.hpp"

using chunkcam::factory::Application;

static void Usage() {
  std::cout << "Usage (refused while the daemon runs):\n"
            << "  chunkcamctl <config.yaml> queue\n"
            << "  chunkcamctl <config.yaml> stats\n"
            << "  chunkcamctl <config.yaml> retry <id>\n"
            << "  chunkcamctl <config.yaml> remove <id>\n"
            << "  chunkcamctl <config.yaml> clear-completed\n"
            << "  chunkcamctl <config.yaml> storage\n"
            << "  chunkcamctl <config.yaml> cleanup\n"
            << "  chunkcamctl <config.yaml> clear-local\n"
            << "  chunkcamctl <config.yaml> settings [export|import <file.json>|reset]\n";
}

static std::string Megabytes(uint64_t bytes) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
  return out.str();
}

static void PrintQueue(const Application& app) {
  for (const auto& item : app.queue->GetSnapshot()) {
    std::cout << item.id() << "  " << std::setw(9) << std::left << chunkcam::model::StatusName(item.status()) << std::right
              << "  retries=" << item.retry_count() << "  " << Megabytes(item.file_size_bytes()) << "  " << item.file_name();
    if (item.has_last_error()) std::cout << "  error=\"" << item.last_error() << "\"";
    std::cout << "\n";
  }
}

static int RunSettings(Application& app, int argc, char** argv) {
  const std::string action = argc >= 4 ? argv[3] : "export";

  if (action == "export") {
    std::cout << app.settings->ExportJson() << "\n";
    return 0;
  }

  if (action == "import") {
    if (argc < 5) return 1;
    std::ifstream in(argv[4]);
    if (!in) {
      std::cerr << "cannot read " << argv[4] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    app.settings->ImportJson(buffer.str());
    std::cout << app.settings->ExportJson() << "\n";
    return 0;
  }

  if (action == "reset") {
    app.settings->ResetToDefaults();
    std::cout << "settings reset\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = chunkcam::config::ConfigLoader::LoadFromYaml(config_path);
    chunkcam::observability::InitializeLogging(config);

    // The daemon owns the queue while it runs.
    chunkcam::util::InstanceLock instance_lock(chunkcam::factory::InstanceLockPath(config));

    // Nothing is started: processing triggered while loading stays queued and
    // is dropped on exit.
    auto app = chunkcam::factory::Build(config);
    app.queue->Initialize();

    // ------------------------------------------------------------

    if (cmd == "queue") {
      PrintQueue(app);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      const auto stats = app.queue->Stats();
      std::cout << "total=" << stats.total << " pending=" << stats.pending << " uploading=" << stats.uploading
                << " completed=" << stats.completed << " failed=" << stats.failed << "\n"
                << "queued=" << Megabytes(stats.total_bytes) << " uploaded=" << Megabytes(stats.uploaded_bytes) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "retry") {
      if (argc < 4) return 1;
      app.queue->RetryUpload(argv[3]);
      std::cout << "queued for retry\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "remove") {
      if (argc < 4) return 1;
      app.queue->RemoveFromQueue(argv[3]);
      std::cout << "removed\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "clear-completed") {
      std::cout << "cleared=" << app.queue->ClearCompleted() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "storage") {
      const auto stats = app.files->Stats(chunkcam::settings::MaxLocalStorageBytes(app.settings->Get()));
      std::cout << "files=" << stats.info.file_count << " used=" << Megabytes(stats.info.total_size_bytes) << " max=" << Megabytes(stats.max_bytes)
                << " usage=" << std::fixed << std::setprecision(1) << stats.usage_percent << "%"
                << " free=" << Megabytes(stats.free_bytes) << "\n";
      if (stats.info.oldest_file_name) std::cout << "oldest=" << *stats.info.oldest_file_name << "\n";
      if (stats.info.newest_file_name) std::cout << "newest=" << *stats.info.newest_file_name << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cleanup") {
      const auto report = app.janitor->EnforceQuotaIfNeeded();
      std::cout << "evicted=" << report.quota.deleted_count << " freed=" << Megabytes(report.quota.freed_bytes)
                << " remaining=" << Megabytes(report.quota.remaining_bytes) << " aged_out=" << report.aged_out << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "clear-local") {
      std::cout << "deleted=" << app.files->ClearAll() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "settings") {
      return RunSettings(app, argc, argv);
    }
  } catch (const chunkcam::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 3;
  } catch (const chunkcam::util::InstanceLocked& e) {
    std::cerr << e.what() << ": stop the chunkcam daemon first\n";
    return 4;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}

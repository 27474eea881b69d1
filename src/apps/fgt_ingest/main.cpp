// File: src/apps/fgt_ingest/main.cpp
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "fgt/core/events/jsonl_event_sink.hpp"
#include "fgt/core/model/ingest_runner.hpp"
#include "fgt/core/util/config_loader.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

struct Args {
  std::string config_path;
  bool help{false};
  bool bad{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.bad = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "fgt_ingest\n"
            << "  --config <path>   YAML config (defaults apply without it)\n"
            << "  --help\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.bad) {
    print_usage();
    return args.help ? 0 : 1;
  }

  auto cfg_r = args.config_path.empty() ? fgt::default_config() : fgt::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  fgt::Config cfg = cfg_r.take_value();

  spdlog::set_level(spdlog::level::from_str(cfg.logging.level));

  fgt::JsonlEventSinkConfig sc;
  sc.output_dir = cfg.paths.output_dir;
  sc.metrics_path = cfg.metrics_path();
  fgt::JsonlEventSink sink(sc);

  fgt::IngestRunner runner(cfg, sink);

  const fgt::Status st_start = runner.start();
  if (!st_start.ok()) {
    spdlog::critical("startup failed: {}", st_start.message());
    return 2;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  runner.run(g_stop);

  const fgt::Status st_stop = runner.stop();
  if (!st_stop.ok()) {
    spdlog::error("final checkpoint failed: {}", st_stop.message());
  }
  spdlog::info("stopped");
  return 0;
}

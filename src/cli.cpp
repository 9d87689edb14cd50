#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "verso/config.hpp"
#include "verso/hash.hpp"
#include "verso/history.hpp"
#include "verso/jsonlite.hpp"
#include "verso/observability.hpp"
#include "verso/report.hpp"
#include "verso/rollback.hpp"
#include "verso/store.hpp"
#include "verso/version.hpp"
#include "verso/wire.hpp"

namespace {

constexpr const char* kDefaultConfigPath = ".verso/config.json";

struct Args {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  std::set<std::string> flags;
};

// Options that take a value; every other --name is a boolean flag.
const std::set<std::string> kValueOptions = {"--message", "--file", "--cursor", "--limit",
                                             "--config"};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      a.positional.push_back(arg);
    } else if (kValueOptions.contains(arg) && i + 1 < argc) {
      a.options[arg] = argv[++i];
    } else {
      a.flags.insert(arg);
    }
  }
  return a;
}

int exit_code_for(verso::ErrorCode code) {
  switch (code) {
    case verso::ErrorCode::not_found:            return 2;
    case verso::ErrorCode::invalid_input:        return 3;
    case verso::ErrorCode::concurrency_conflict: return 4;
    default:                                     return 1;
  }
}

int fail(verso::ErrorCode code, const std::string& message) {
  std::cerr << verso::error_to_json(code, message) << "\n";
  return exit_code_for(code);
}

int usage() {
  std::cerr << "usage: verso [--config path] <command> ...\n"
               "  create <doc> <author> [--message m] [--file path]   (content from stdin without --file)\n"
               "  list <doc> [--cursor id] [--limit n]\n"
               "  show <doc> <id|current>\n"
               "  compare <doc> <a> <b|current> [--side-by-side|--unified|--json]\n"
               "  rollback <doc> <id> <author>\n"
               "  stats <doc> | stats --engine\n"
               "  docs\n"
               "  config\n"
               "  version\n";
  return 3;
}

bool read_all(std::istream& in, std::string* out) {
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.positional.empty()) return usage();
  const std::string& cmd = args.positional[0];
  const auto& pos = args.positional;

  if (cmd == "version") {
    const auto h = verso::hash_runtime_info();
    std::cout << "{\"manifest\":" << verso::version::manifest_to_json(verso::version::current_manifest())
              << ",\"hash_version\":\"" << h.version << "\"}\n";
    return 0;
  }

  // The CLI persists between invocations, so it defaults to the file store.
  verso::EngineConfig config;
  config.store.backend = "fs";
  std::string config_error;
  const auto cfg_it = args.options.find("--config");
  const std::string config_path = cfg_it != args.options.end() ? cfg_it->second : kDefaultConfigPath;
  if (!verso::load_config(config_path, &config, &config_error)) {
    return fail(verso::ErrorCode::config_invalid, config_error);
  }
  verso::apply_env_overrides(&config);

  if (cmd == "config") {
    std::cout << verso::config_to_json(config) << "\n";
    return 0;
  }

  if (cmd == "stats" && args.flags.contains("--engine")) {
    std::cout << verso::global_engine_stats().to_json() << "\n";
    return 0;
  }

  auto store = verso::make_store(config);
  if (!store) return fail(verso::ErrorCode::config_invalid, "unknown backend " + config.store.backend);
  verso::HistoryQuery history(store, config.diff);

  if (cmd == "create") {
    if (pos.size() < 3) return usage();
    std::string content;
    if (const auto it = args.options.find("--file"); it != args.options.end()) {
      std::ifstream ifs(it->second, std::ios::binary);
      if (!ifs || !read_all(ifs, &content)) {
        return fail(verso::ErrorCode::invalid_input, "cannot read " + it->second);
      }
    } else if (!read_all(std::cin, &content)) {
      return fail(verso::ErrorCode::invalid_input, "cannot read stdin");
    }
    std::optional<std::string> message;
    if (const auto it = args.options.find("--message"); it != args.options.end()) message = it->second;

    const auto r = store->create_version(pos[1], content, pos[2], message);
    if (!r.ok) return fail(r.error, r.message);
    std::cout << verso::version_to_json(r.version, false) << "\n";
    return 0;
  }

  if (cmd == "list") {
    if (pos.size() < 2) return usage();
    std::string cursor;
    uint32_t limit = 0;
    if (const auto it = args.options.find("--cursor"); it != args.options.end()) cursor = it->second;
    if (const auto it = args.options.find("--limit"); it != args.options.end()) {
      char* end = nullptr;
      const unsigned long n = std::strtoul(it->second.c_str(), &end, 10);
      if (it->second.empty() || *end != '\0' || n > 100000) {
        return fail(verso::ErrorCode::invalid_input, "bad --limit " + it->second);
      }
      limit = static_cast<uint32_t>(n);
    }
    const auto r = history.list_versions(pos[1], cursor, limit);
    if (!r.ok) return fail(r.error, r.message);
    std::cout << verso::page_to_json(r.page) << "\n";
    return 0;
  }

  if (cmd == "show") {
    if (pos.size() < 3) return usage();
    const auto r = pos[2] == verso::kCurrentVersion ? history.current(pos[1])
                                                    : history.get_version(pos[1], pos[2]);
    if (!r.ok) return fail(r.error, r.message);
    std::cout << verso::version_to_json(r.version) << "\n";
    return 0;
  }

  if (cmd == "compare") {
    if (pos.size() < 4) return usage();
    const auto r = history.compare(pos[1], pos[2], pos[3]);
    if (!r.ok) return fail(r.error, r.message);
    if (r.error == verso::ErrorCode::size_limit_exceeded) {
      std::cerr << "{\"warning\":\"size_limit_exceeded\",\"message\":"
                << verso::jsonlite::quote(r.message) << "}\n";
    }
    if (args.flags.contains("--side-by-side")) {
      std::cout << verso::side_by_side_to_json(verso::side_by_side(r.comparison.diff)) << "\n";
    } else if (args.flags.contains("--unified")) {
      std::cout << verso::render_unified(r.comparison.diff);
    } else {
      std::cout << verso::comparison_to_json(r.comparison) << "\n";
    }
    return 0;
  }

  if (cmd == "rollback") {
    if (pos.size() < 4) return usage();
    verso::RollbackCoordinator coordinator(store, config.rollback_attempts);
    const auto r = coordinator.rollback(pos[1], pos[2], pos[3]);
    if (!r.ok) return fail(r.error, r.message);
    std::cout << verso::version_to_json(r.version, false) << "\n";
    return 0;
  }

  if (cmd == "stats") {
    if (pos.size() < 2) return usage();
    const auto r = history.statistics(pos[1]);
    if (!r.ok) return fail(r.error, r.message);
    std::cout << verso::stats_to_json(r.stats) << "\n";
    return 0;
  }

  if (cmd == "docs") {
    std::cout << "[";
    bool first = true;
    for (const auto& d : store->list_documents()) {
      if (!first) std::cout << ",";
      first = false;
      std::cout << "\"" << d << "\"";
    }
    std::cout << "]\n";
    return 0;
  }

  return usage();
}

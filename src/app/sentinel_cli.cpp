#include <fstream>
#include <iostream>

#include "core/api/command_script.hpp"
#include "core/api/core_api.hpp"
#include "core/config/config.hpp"
#include "core/model/app_meta.hpp"

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitConfig = 1;

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << sentinel::kAppDisplayName << ' ' << sentinel::kAppVersion << " (" << sentinel::kBuildRelease
              << ")\n";
    std::cerr << "usage: " << sentinel::kCliName << " <config-file> [script-file]\n";
    std::cerr << "Reads one `command|field|...` per line from the script, or stdin when omitted.\n";
    return kExitUsage;
  }

  sentinel::SentinelConfig config;
  if (const sentinel::Result loaded = sentinel::load_config_file(argv[1], config); !loaded.ok) {
    std::cerr << sentinel::kCliName << " config error: " << loaded.message << '\n';
    return kExitConfig;
  }

  sentinel::SentinelCore core;
  if (const sentinel::Result init = core.init(config); !init.ok) {
    std::cerr << sentinel::kCliName << " init failed: " << init.message << '\n';
    return kExitConfig;
  }

  if (argc == 3) {
    std::ifstream script(argv[2]);
    if (!script) {
      std::cerr << sentinel::kCliName << ": unable to open script " << argv[2] << '\n';
      return kExitUsage;
    }
    sentinel::run_command_script(core, script, std::cout);
    return 0;
  }
  sentinel::run_command_script(core, std::cin, std::cout);
  return 0;
}

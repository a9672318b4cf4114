#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Simulation:\n"
      << "  --nodes=<n>          Number of gossip nodes (default: 1000)\n"
      << "  --peers=<k>          Random peers per node (default: 4)\n"
      << "  --content=<text>     Message to disseminate\n"
      << "  --ttl=<hops>         Hop budget of the message (default: 20)\n"
      << "  --seed=<n>           RNG seed for topology and layout (default: random)\n"
      << "  --settle-ms=<ms>     Maximum time to wait for propagation (default: 2000)\n"
      << "  --queue=<n>          Inbound queue capacity per node (default: 256)\n"
      << "  --output=<dir>       Write network_visualization.json to <dir>\n"
      << "                       (default: output, empty to disable)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, gossip, analysis, app, all\n"
      << "                       Can be comma-separated: --debug=network,gossip\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

// Parse "--flag=<n>" into [min, max]; prints an error and returns nullopt on failure
std::optional<int> parse_int_flag(const std::string &arg, size_t prefix_len,
                                  int min, int max) {
  auto value = gossipnet::util::SafeParseInt(arg.substr(prefix_len), min, max);
  if (!value) {
    std::cerr << "Error: Invalid value for " << arg.substr(0, prefix_len - 1)
              << ": " << arg.substr(prefix_len) << std::endl;
    std::cerr << "Value must be a number between " << min << " and " << max
              << std::endl;
  }
  return value;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    gossipnet::app::SimulationConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << gossipnet::GetFullVersionString() << std::endl;
        std::cout << gossipnet::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--nodes=") == 0) {
        auto v = parse_int_flag(arg, 8, 1, 60000);
        if (!v) return 1;
        config.node_count = static_cast<size_t>(*v);
      } else if (arg.find("--peers=") == 0) {
        auto v = parse_int_flag(arg, 8, 0, 60000);
        if (!v) return 1;
        config.peers_per_node = static_cast<size_t>(*v);
      } else if (arg.find("--content=") == 0) {
        config.content = arg.substr(10);
      } else if (arg.find("--ttl=") == 0) {
        auto v = parse_int_flag(arg, 6, 0, 1000);
        if (!v) return 1;
        config.max_ttl = *v;
      } else if (arg.find("--seed=") == 0) {
        auto seed = gossipnet::util::SafeParseUInt64(arg.substr(7));
        if (!seed) {
          std::cerr << "Error: Invalid seed: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.seed = *seed;
      } else if (arg.find("--settle-ms=") == 0) {
        auto v = parse_int_flag(arg, 12, 1, 600000);
        if (!v) return 1;
        config.settle_time = std::chrono::milliseconds(*v);
      } else if (arg.find("--queue=") == 0) {
        auto v = parse_int_flag(arg, 8, 1, 1000000);
        if (!v) return 1;
        config.queue_capacity = static_cast<size_t>(*v);
      } else if (arg.find("--output=") == 0) {
        config.output_dir = arg.substr(9);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,gossip
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    gossipnet::util::LogManager::Initialize(log_level);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        gossipnet::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        gossipnet::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        gossipnet::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Nested scope: the simulation (and every node thread) is gone before
    // LogManager::Shutdown()
    int exit_code = 0;
    {
      gossipnet::app::Simulation simulation(config);

      if (!simulation.initialize()) {
        LOG_ERROR("Failed to initialize simulation");
        exit_code = 1;
      } else if (!simulation.run()) {
        LOG_ERROR("Simulation failed");
        exit_code = 1;
      }
    }

    gossipnet::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    gossipnet::util::LogManager::Shutdown();
    return 1;
  }
}

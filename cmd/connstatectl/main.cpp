#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/state_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"
#include "internal/util/time.hpp"

using connstate::core::ConnectionSnapshot;
using connstate::core::HistoryQuery;
using connstate::core::StateStore;

static void Usage() {
  std::cout << "Usage:\n"
            << "  connstatectl --config <config.yaml> connect <channel_id> [guild_id]\n"
            << "  connstatectl --config <config.yaml> disconnect\n"
            << "  connstatectl --config <config.yaml> status\n"
            << "  connstatectl --config <config.yaml> history [limit]\n";
}

static void PrintSnapshot(const ConnectionSnapshot& snapshot) {
  std::cout << "channel_id=" << snapshot.channel_id << " guild_id=" << snapshot.guild_id.value_or("-")
            << " connected_at=" << connstate::util::FormatIso8601(snapshot.connected_at)
            << " last_updated=" << connstate::util::FormatIso8601(snapshot.last_updated) << "\n";
}

static int RunCommand(StateStore& store, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  if (cmd == "connect" && (args.size() == 2 || args.size() == 3)) {
    std::optional<std::string> guild_id;
    if (args.size() == 3) guild_id = args[2];
    store.Connect(args[1], guild_id);
    std::cout << "connected channel_id=" << args[1] << "\n";
    return 0;
  }

  if (cmd == "disconnect" && args.size() == 1) {
    auto removed = store.Disconnect();
    if (!removed) {
      std::cout << "no active connection\n";
      return 0;
    }
    std::cout << "disconnected ";
    PrintSnapshot(*removed);
    return 0;
  }

  if (cmd == "status" && args.size() == 1) {
    auto current = store.GetCurrent();
    if (!current) {
      std::cout << "not connected\n";
      return 0;
    }
    std::cout << "connected ";
    PrintSnapshot(*current);
    return 0;
  }

  if (cmd == "history" && args.size() <= 2) {
    HistoryQuery query;
    if (args.size() == 2) {
      const auto limit = connstate::util::ParseCount(args[1]);
      if (!limit) {
        std::cerr << "invalid limit: " << args[1] << "\n";
        return 1;
      }
      query.pagination.limit = *limit;
    }

    for (const auto& event : store.History(query)) {
      std::cout << event.id << ' ' << connstate::util::FormatIso8601(event.timestamp) << ' '
                << connstate::db::model::HistoryActionName(event.action) << " channel_id=" << event.channel_id
                << " guild_id=" << event.guild_id.value_or("-");
      if (event.error_message) std::cout << " message=\"" << *event.error_message << '"';
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = connstate::config::ConfigLoader::LoadFromYaml(config_path);
    connstate::observability::InitializeLogging(config);

    auto runtime = connstate::factory::BuildRuntime(config);
    const int rc = RunCommand(*runtime.state_store, args);

    connstate::observability::ShutdownLogging();
    return rc;
  } catch (const connstate::util::ValidationError& e) {
    std::cerr << "invalid input: " << e.what() << "\n";
    connstate::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    CONNSTATE_LOG_ERROR("Fatal error", {connstate::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    connstate::observability::ShutdownLogging();
    return 2;
  }
}

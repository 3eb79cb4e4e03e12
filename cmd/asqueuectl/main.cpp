#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/delivery/transaction_body.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using asqueue::queue::EventQueueStore;

static void Usage() {
  std::cout << "Usage:\n"
            << "  asqueuectl <config.yaml> destinations\n"
            << "  asqueuectl <config.yaml> count <destination>\n"
            << "  asqueuectl <config.yaml> peek <destination> [limit]\n"
            << "  asqueuectl <config.yaml> enqueue <destination> <event_id> <room_id> <type> <sender> [content_json]\n"
            << "  asqueuectl <config.yaml> ack <destination> <sequence_id>\n"
            << "  asqueuectl <config.yaml> ack-event <event_id>\n";
}

static std::optional<uint64_t> ParseU64(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static int Run(EventQueueStore& store, int argc, char** argv) {
  const std::string cmd = argv[2];

  // ------------------------------------------------------------

  if (cmd == "destinations") {
    for (const auto& destination : store.ListDestinations()) {
      std::cout << destination << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "count") {
    if (argc < 4) return 1;

    std::cout << store.CountByDestination(argv[3]) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "peek") {
    if (argc < 4) return 1;

    uint64_t limit = 10;
    if (argc >= 5) {
      auto parsed = ParseU64(argv[4]);
      if (!parsed.has_value() || *parsed == 0 || *parsed > 10000) {
        std::cerr << "invalid limit: " << argv[4] << "\n";
        return 1;
      }
      limit = *parsed;
    }

    auto batch = store.SelectEventsByDestination(argv[3], static_cast<int>(limit));
    std::cout << "txn_id=" << asqueue::delivery::TransactionId(batch) << " events=" << batch.events.size() << "\n";
    std::cout << asqueue::delivery::BuildTransactionBody(batch) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 8) return 1;

    asqueue::model::Event event;
    event.event_id         = argv[4];
    event.room_id          = argv[5];
    event.type             = argv[6];
    event.sender           = argv[7];
    event.origin_server_ts = asqueue::util::NowUnixMillis();
    if (argc >= 9) {
      event.content = argv[8];
    }

    std::cout << "sequence_id=" << store.InsertEvent(argv[3], event) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ack") {
    if (argc < 5) return 1;

    auto sequence_id = ParseU64(argv[4]);
    if (!sequence_id.has_value()) {
      std::cerr << "invalid sequence id: " << argv[4] << "\n";
      return 1;
    }

    std::cout << "deleted=" << store.DeleteUpToSequence(argv[3], *sequence_id) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ack-event") {
    if (argc < 4) return 1;

    std::cout << "deleted=" << store.DeleteUpToID(argv[3]) << "\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    auto config = asqueue::config::ConfigLoader::LoadFromYaml(argv[1]);
    asqueue::observability::InitializeLogging(config);

    auto runtime = asqueue::factory::Build(config);
    int  rc      = Run(*runtime.store, argc, argv);
    if (rc == 1) {
      Usage();
    }

    asqueue::observability::ShutdownLogging();
    return rc;
  } catch (const asqueue::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    asqueue::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    ASQUEUE_LOG_ERROR("Fatal error", {asqueue::observability::StringField("error", e.what())});
    asqueue::observability::ShutdownLogging();
    return 2;
  }
}

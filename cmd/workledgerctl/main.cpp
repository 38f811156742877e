#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/lease/lease_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/progress_service.hpp"
#include "internal/service/request_service.hpp"
#include "internal/util/metadata.hpp"
#include "workledger/v1.hpp"

using namespace workledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  workledgerctl <config.yaml> add-request <scope> <name> [requester] [priority] [workload_id]\n"
            << "  workledgerctl <config.yaml> get-request <request_id>\n"
            << "  workledgerctl <config.yaml> claim <status> [bulk_size] [time_period_sec]\n"
            << "  workledgerctl <config.yaml> reclaim [lock_timeout_sec]\n"
            << "  workledgerctl <config.yaml> cancel <request_id>\n"
            << "  workledgerctl <config.yaml> stats [coll_id]\n";
}

// "new", "NEW" or "REQUEST_STATUS_NEW"
static std::optional<RequestStatus> ParseRequestStatus(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (value.rfind("REQUEST_STATUS_", 0) != 0) {
    value = "REQUEST_STATUS_" + value;
  }
  RequestStatus status;
  if (!RequestStatus_Parse(value, &status)) {
    return std::nullopt;
  }
  return status;
}

static void PrintRequest(const workledger::db::model::RequestRecord& r) {
  std::cout << "request_id=" << r.request_id << " scope=" << r.scope << " name=" << r.name << " status=" << RequestStatus_Name(r.status)
            << " locking=" << RequestLocking_Name(r.locking) << " priority=" << r.priority << " lifetime=" << r.lifetime
            << " generation=" << r.lease_generation;
  if (r.workload_id) {
    std::cout << " workload_id=" << *r.workload_id;
  }
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = workledger::config::ConfigLoader::LoadFromYaml(config_path);
    workledger::observability::InitializeLogging(config);

    auto app = workledger::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "add-request") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      workledger::db::model::RequestRecord request;
      request.scope = argv[3];
      request.name  = argv[4];
      if (argc >= 6) request.requester = argv[5];
      if (argc >= 7) request.priority = std::stoi(argv[6]);
      if (argc >= 8) {
        workledger::util::Metadata metadata;
        workledger::util::SetInt(metadata, "workload_id", std::stoll(argv[7]));
        request.request_metadata = std::move(metadata);
      }

      std::cout << "request_id=" << app.requests->AddRequest(std::move(request)) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get-request") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      PrintRequest(app.requests->GetRequest(std::stoull(argv[3])));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "claim") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto status = ParseRequestStatus(argv[3]);
      if (!status) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }

      workledger::lease::ClaimOptions options;
      options.statuses = {*status};
      options.lock     = true;
      if (argc >= 5) {
        options.bulk_size = std::stoull(argv[4]);
      } else if (config.leases().claim_bulk_size() > 0) {
        options.bulk_size = config.leases().claim_bulk_size();
      }
      if (argc >= 6) options.time_period_sec = std::stoull(argv[5]);

      const auto claimed = app.leases->Claim(options);
      for (const auto& request : claimed) {
        PrintRequest(request);
        std::cout << "  fencing_token=" << workledger::lease::FencingToken(request) << "\n";
      }
      std::cout << "claimed=" << claimed.size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "reclaim") {
      const uint64_t timeout = argc >= 4 ? std::stoull(argv[3]) : workledger::config::LockTimeoutSec(config);
      std::cout << "reclaimed=" << app.leases->ReclaimExpiredLocks(timeout) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cancel") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      app.requests->CancelRequest(std::stoull(argv[3]));
      std::cout << "cancelled\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      std::optional<uint64_t> coll_id;
      if (argc >= 4) coll_id = std::stoull(argv[3]);

      for (const auto& [status, count] : app.progress->CountByStatus(coll_id)) {
        std::cout << ContentStatus_Name(status) << "=" << count << "\n";
      }
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid number: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    const auto status = workledger::grpc::ToStatus(e);
    std::cerr << status.error_details() << ": " << status.error_message() << "\n";
    return workledger::grpc::IsRetryable(status) ? 3 : 2;
  }
}

// -----------------------------------------------------------------------------
// gmx_orderd — order-construction daemon.
//
//   gmx_orderd <config.json>
//
//   1) Load the EngineConfig from the JSON file named on the command line.
//   2) Create the OrderEngine and start it: connects the ledger gateway and
//      signing bridges, loads the token/market registry, binds the IPC
//      command and telemetry sockets.
//   3) Log allowance outcomes on the console (the pipeline logs its own
//      terminal states).
//   4) Wait on the main thread until Ctrl-C.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread     → waits for SIGINT
//   ipc thread      → executes RESOLVE / SUBMIT commands (pipeline runs here)
//   worker pool     → read-only fan-out of registry, oracle and ledger reads
// -----------------------------------------------------------------------------

#include "gmx/config/engine_config.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/engine/order_engine.hpp"
#include "gmx/events/pipeline_events.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// The only global: a flag the SIGINT handler sets. Lock-free atomic stores
// are async-signal-safe.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration. Loaded once, immutable afterwards.
  // -------------------------------------------------------------------------
  gmx::EngineConfig config;
  try {
    config = gmx::loadEngineConfig(argv[1]);
  } catch (const gmx::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine. Subscribe the console logger BEFORE start() so the first run
  //    is visible.
  // -------------------------------------------------------------------------
  gmx::OrderEngine engine(config);

  engine.eventBus().subscribe<gmx::AllowanceEvent>(
      [](const gmx::AllowanceEvent& e) {
        std::cout << "[Allowance] run=" << e.run_id
                  << " token=" << e.token_address
                  << " required=" << e.required_amount
                  << (e.approval_tx_id.empty()
                          ? std::string(" sufficient")
                          : " approved tx=" + e.approval_tx_id)
                  << "\n";
      });

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Install SIGINT handler so Ctrl-C triggers a clean shutdown.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  if (!config.ipc_cmd_endpoint.empty()) {
    std::cout << "[main] accepting commands on " << config.ipc_cmd_endpoint
              << ", telemetry on " << config.ipc_pub_endpoint << "\n";
  } else {
    std::cout << "[main] no IPC endpoints configured; nothing to serve.\n";
  }
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 4) Clean shutdown: IPC thread joined first, then pool and bridges.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}

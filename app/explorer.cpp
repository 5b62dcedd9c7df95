/**
 * Block explorer HTTP API backed by a Bitcoin Core compatible node.
 */
#include "../explorer/BlockResolver.h"
#include "../explorer/LatestBlocks.h"
#include "../explorer/TxResolver.h"
#include "../lib/Logger.h"
#include "../rpc/RpcClient.h"
#include "../server/ApiServer.h"
#include "../server/Config.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace {
std::atomic<bool> g_running{true};
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}
} // namespace

int main(int argc, char **argv) {
  CLI::App app{"Bitcoin block explorer HTTP API"};

  std::string configPath = bx::AppConfig::DEFAULT_FILE;
  std::string bindHost;
  uint16_t port = 0;
  std::string rpcUrl;
  std::string rpcUser;
  std::string rpcPassword;
  std::string logLevel;
  std::string logFile;
  bool parallel = false;

  auto *optConfig = app.add_option("-c,--config", configPath, "Configuration file (JSON)");
  auto *optBind = app.add_option("--bind", bindHost, "HTTP bind address");
  auto *optPort = app.add_option("--port", port, "HTTP server port")->check(CLI::Range(1, 65535));
  auto *optRpcUrl = app.add_option("--rpc-url", rpcUrl, "Node JSON-RPC url");
  auto *optRpcUser = app.add_option("--rpc-user", rpcUser, "Node JSON-RPC user");
  auto *optRpcPassword = app.add_option("--rpc-password", rpcPassword, "Node JSON-RPC password");
  auto *optLogLevel = app.add_option("--log-level", logLevel, "debug, info, warning, error or critical");
  auto *optLogFile = app.add_option("--log-file", logFile, "Also write the log to this file");
  auto *optParallel = app.add_flag("--parallel", parallel, "Fetch latest blocks concurrently");
  CLI11_PARSE(app, argc, argv);

  auto rootLogger = bx::logging::getRootLogger();
  auto logger = bx::logging::getLogger("explorer");

  bx::AppConfig::Overrides overrides;
  if (optBind->count() > 0) {
    overrides.host = bindHost;
  }
  if (optPort->count() > 0) {
    overrides.port = port;
  }
  if (optRpcUrl->count() > 0) {
    overrides.rpcUrl = rpcUrl;
  }
  if (optRpcUser->count() > 0) {
    overrides.rpcUser = rpcUser;
  }
  if (optRpcPassword->count() > 0) {
    overrides.rpcPassword = rpcPassword;
  }
  if (optLogLevel->count() > 0) {
    overrides.logLevel = logLevel;
  }
  if (optLogFile->count() > 0) {
    overrides.logFile = logFile;
  }
  if (optParallel->count() > 0) {
    overrides.parallelFetch = parallel;
  }

  auto loaded = bx::AppConfig::load(configPath, optConfig->count() > 0, overrides);
  if (!loaded) {
    logger.critical << "Invalid configuration (" << configPath << "): " << loaded.error().message;
    return 1;
  }
  const bx::AppConfig config = loaded.value();

  rootLogger.setLevel(config.log.level);
  if (!config.log.file.empty()) {
    try {
      rootLogger.addFileHandler(config.log.file, config.log.level);
    } catch (const std::runtime_error &e) {
      logger.critical << e.what();
      return 1;
    }
  }
  logger.info << "Configuration: " << config.toJson().dump();

  bx::rpc::RpcClient node;
  auto configured = node.setConfig(config.rpc);
  if (!configured) {
    logger.critical << "Invalid RPC settings: " << configured.error().message;
    return 1;
  }

  bx::explorer::BlockResolver blocks(node);
  bx::explorer::TxResolver txs(node);
  txs.setConfig(config.tx);
  bx::explorer::LatestBlocks latest(node, blocks);
  latest.setConfig(config.latest);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  bx::ApiServer server(blocks, txs, latest);
  auto started = server.start(config.server);
  if (!started) {
    logger.critical << "Failed to start HTTP API: " << started.error().message;
    return 1;
  }

  std::cout << "Explorer API on http://" << config.server.host << ":" << server.getPort()
            << "\n";
  std::cout << "Press Ctrl+C to stop...\n";

  std::unique_lock<std::mutex> lock(g_mutex);
  g_cv.wait(lock, [] { return !g_running.load(); });

  server.stop();
  logger.info << "Explorer stopped";
  return 0;
}

#include "ApiServer.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace bx {

ApiServer::ApiServer(explorer::BlockResolver &blocks, explorer::TxResolver &txs,
                     explorer::LatestBlocks &latest)
    : Service("explorer.http"), blocks_(blocks), txs_(txs), latest_(latest) {}

ApiServer::~ApiServer() { stop(); }

ApiServer::Roe<void> ApiServer::start(const Config &config) {
  config_ = config;
  return Service::start();
}

std::string ApiServer::failureMessage(const std::string &path) {
  if (path.rfind("/block/", 0) == 0) {
    return explorer::ApiError::MSG_BLOCK_FAILED;
  }
  if (path.rfind("/tx/", 0) == 0) {
    return explorer::ApiError::MSG_TX_FAILED;
  }
  if (path == "/latest_blocks") {
    return explorer::ApiError::MSG_LATEST_FAILED;
  }
  return "Internal server error";
}

void ApiServer::setTextError(httplib::Response &res, const explorer::ApiError &err) {
  res.status = err.httpStatus;
  res.set_content(err.message, "text/plain");
}

ApiServer::Roe<void> ApiServer::onStart() {
  upServer_ = std::make_unique<httplib::Server>();
  const size_t threads = config_.threads == 0 ? 1 : config_.threads;
  upServer_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

  upServer_->set_logger([this](const httplib::Request &req, const httplib::Response &res) {
    log().info << req.method << " " << req.path << " " << res.status << " ("
               << (req.remote_addr.empty() ? "-" : req.remote_addr) << ")";
  });
  upServer_->set_exception_handler(
      [this](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        try {
          std::rethrow_exception(ep);
        } catch (const std::exception &e) {
          log().error << "Unhandled exception on " << req.path << ": " << e.what();
        } catch (...) {
          log().error << "Unhandled non-standard exception on " << req.path;
        }
        res.status = explorer::ApiError::HTTP_INTERNAL_ERROR;
        res.set_content(failureMessage(req.path), "text/plain");
      });

  // CORS: the API is public and read-only
  upServer_->set_default_headers(httplib::Headers{
      {"Access-Control-Allow-Origin", "*"},
      {"Access-Control-Allow-Methods", "GET, OPTIONS"},
      {"Access-Control-Allow-Headers", "Content-Type"},
      {"Access-Control-Max-Age", "86400"},
  });
  upServer_->set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res) {
    if (req.method == "OPTIONS") {
      res.status = 204;
      return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
  });

  registerRoutes();

  if (config_.port == 0) {
    int port = upServer_->bind_to_any_port(config_.host);
    if (port <= 0) {
      return Error(1, "Failed to bind " + config_.host + " on any port");
    }
    boundPort_ = static_cast<uint16_t>(port);
  } else {
    if (!upServer_->bind_to_port(config_.host, config_.port)) {
      return Error(1, "Failed to bind " + config_.host + ":" + std::to_string(config_.port));
    }
    boundPort_ = config_.port;
  }

  log().info << "HTTP API listening on " << config_.host << ":" << boundPort_;
  log().info << "Routes: GET /block/<hash>, /tx/<txid>, /latest_blocks";
  return {};
}

void ApiServer::registerRoutes() {
  // GET /block/:hash - any segment is routed so that bad hashes get a 400
  upServer_->Get(R"(/block/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
    auto r = blocks_.resolve(req.matches[1].str());
    if (!r) {
      setTextError(res, r.error());
      return;
    }
    res.set_content(r.value().toJson().dump(), "application/json");
  });

  // GET /tx/:txid
  upServer_->Get(R"(/tx/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
    auto r = txs_.resolve(req.matches[1].str());
    if (!r) {
      setTextError(res, r.error());
      return;
    }
    res.set_content(r.value().toJson().dump(), "application/json");
  });

  // GET /latest_blocks
  upServer_->Get("/latest_blocks", [this](const httplib::Request &, httplib::Response &res) {
    auto r = latest_.list();
    if (!r) {
      setTextError(res, r.error());
      return;
    }
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &block : r.value()) {
      arr.push_back(block.toJson());
    }
    res.set_content(arr.dump(), "application/json");
  });
}

void ApiServer::runLoop() {
  if (!upServer_->listen_after_bind()) {
    log().error << "HTTP server terminated abnormally";
  }
}

void ApiServer::onStopRequest() {
  if (upServer_) {
    // A stop issued before listen() started would otherwise be lost
    upServer_->wait_until_ready();
    upServer_->stop();
  }
}

} // namespace bx

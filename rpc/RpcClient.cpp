#include "RpcClient.h"
#include "../lib/Utilities.h"

#include <httplib.h>

#include <exception>
#include <memory>

namespace bx {
namespace rpc {

std::string RpcClient::Endpoint::schemeHostPort() const {
  std::string h = host.find(':') == std::string::npos ? host : "[" + host + "]";
  return scheme + "://" + h + ":" + std::to_string(port);
}

RpcClient::RpcClient() : Module("explorer.rpc") {}

RpcClient::ConfigRoe<RpcClient::Endpoint> RpcClient::parseUrl(const std::string &url) {
  Endpoint ep;
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    return Error(E_INVALID_URL, "Missing scheme in RPC url: " + url);
  }
  ep.scheme = utl::toLower(url.substr(0, schemeEnd));
  if (ep.scheme != "http" && ep.scheme != "https") {
    return Error(E_INVALID_URL, "Unsupported scheme in RPC url: " + url);
  }

  std::string rest = url.substr(schemeEnd + 3);
  auto pathStart = rest.find('/');
  std::string authority = rest.substr(0, pathStart);
  if (pathStart != std::string::npos) {
    ep.path = rest.substr(pathStart);
  }
  if (authority.empty()) {
    return Error(E_INVALID_URL, "Missing host in RPC url: " + url);
  }
  if (authority.find('@') != std::string::npos) {
    return Error(E_INVALID_URL, "Credentials in RPC url are not supported, use user and password");
  }

  // [v6addr] or [v6addr]:port
  if (authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos || close == 1) {
      return Error(E_INVALID_URL, "Invalid IPv6 host in RPC url: " + url);
    }
    ep.host = authority.substr(1, close - 1);
    if (ep.host.find_first_not_of("0123456789abcdefABCDEF:.") != std::string::npos) {
      return Error(E_INVALID_URL, "Invalid IPv6 host in RPC url: " + url);
    }
    std::string tail = authority.substr(close + 1);
    if (tail.empty()) {
      return ep;
    }
    if (tail[0] != ':' || !utl::parsePort(tail.substr(1), ep.port) || ep.port == 0) {
      return Error(E_INVALID_URL, "Invalid port in RPC url: " + url);
    }
    return ep;
  }

  if (authority.find(':') == std::string::npos) {
    ep.host = authority;
    return ep;
  }
  if (!utl::parseHostPort(authority, ep.host, ep.port) || ep.port == 0 ||
      ep.host.find(':') != std::string::npos) {
    return Error(E_INVALID_URL, "Invalid host:port in RPC url: " + url);
  }
  return ep;
}

RpcClient::ConfigRoe<void> RpcClient::setConfig(const Config &config) {
  auto ep = parseUrl(config.url);
  if (!ep) {
    return ep.error();
  }
  config_ = config;
  endpoint_ = ep.value();
  configured_ = true;
  log().info << "Node endpoint: " << endpoint_.schemeHostPort() << endpoint_.path;
  return {};
}

Roe<nlohmann::json> RpcClient::makeRequest(uint64_t id, const std::string &method,
                                           const nlohmann::json &params) {
  if (!params.is_null() && !params.is_array()) {
    return RpcError::decode("RPC params for " + method + " must be a JSON array, got " +
                            params.type_name());
  }
  return nlohmann::json{{"jsonrpc", "2.0"},
                        {"id", id},
                        {"method", method},
                        {"params", params.is_array() ? params : nlohmann::json::array()}};
}

Roe<nlohmann::json> RpcClient::decodeResponse(const std::string &body, uint64_t id) {
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    return RpcError::decode("Invalid JSON in node reply: " + std::string(e.what()));
  }

  if (!reply.is_object()) {
    return RpcError::decode("Node reply is not a JSON object");
  }

  if (reply.contains("id") && !reply["id"].is_null() && reply["id"] != nlohmann::json(id)) {
    return RpcError::decode("Node reply id " + reply["id"].dump() +
                            " does not match request id " + std::to_string(id));
  }

  if (reply.contains("error") && !reply["error"].is_null()) {
    const auto &err = reply["error"];
    if (err.is_object()) {
      int64_t code = 0;
      if (err.contains("code") && err["code"].is_number_integer()) {
        code = err["code"].get<int64_t>();
      }
      std::string message = err.contains("message") && err["message"].is_string()
                                ? err["message"].get<std::string>()
                                : err.dump();
      return RpcError::nodeRejected(code, message);
    }
    return RpcError::nodeRejected(0, err.dump());
  }

  if (!reply.contains("result") || reply["result"].is_null()) {
    return RpcError::decode("Node reply carries neither result nor error");
  }
  return reply["result"];
}

Roe<nlohmann::json> RpcClient::call(const std::string &method,
                                    const nlohmann::json &params) {
  if (!configured_) {
    return RpcError::transport("RPC client is not configured");
  }

  const uint64_t id = nextId_++;
  auto request = makeRequest(id, method, params);
  if (!request) {
    log().error << "RPC call not sent: " << request.error();
    return request;
  }
  const std::string body = request.value().dump();
  log().debug << "Making RPC call: method=" << method << ", params=" << params.dump();

  // Throws for https when httplib was built without TLS support
  std::unique_ptr<httplib::Client> cli;
  try {
    cli = std::make_unique<httplib::Client>(endpoint_.schemeHostPort());
  } catch (const std::exception &e) {
    log().error << "Cannot create RPC connection: " << e.what();
    return RpcError::transport("RPC connection error: " + std::string(e.what()));
  }
  if (!cli->is_valid()) {
    log().error << "Cannot create RPC connection to " << endpoint_.schemeHostPort();
    return RpcError::transport("RPC connection error: unusable endpoint " +
                               endpoint_.schemeHostPort());
  }
  cli->set_basic_auth(config_.user, config_.password);
  cli->set_connection_timeout(config_.connectTimeout);
  cli->set_read_timeout(config_.readTimeout);

  auto res = cli->Post(endpoint_.path, body, "application/json");
  if (!res) {
    log().error << "Failed to connect to RPC server: method=" << method
                << ", error=" << httplib::to_string(res.error());
    return RpcError::transport("RPC connection error: " + httplib::to_string(res.error()));
  }

  log().debug << "RPC response status: " << res->status;
  if (res->status < 200 || res->status >= 300) {
    log().error << "RPC server returned non-OK status. Status: " << res->status
                << ", Body: " << res->body;
    return RpcError::transport("RPC server error. Status: " + std::to_string(res->status),
                               res->status);
  }

  auto result = decodeResponse(res->body, id);
  if (!result) {
    log().error << "RPC call failed: method=" << method << ", error=" << result.error();
    return result;
  }
  log().debug << "RPC call successful: method=" << method;
  return result;
}

} // namespace rpc
} // namespace bx

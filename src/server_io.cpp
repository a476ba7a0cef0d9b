#include "server_io.h"

#include <map>
#include <mutex>
#include <memory>
#include <thread>

#include <httplib.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <grove/bridge.h>
#include <grove/execution.h>
#include <grove/launcher.h>
#include <grove/registry.h>
#include <grove/utils.h>
#include "websocket.h"

namespace {

WsServer::CloseCode CloseCodeOf(CloseReason reason) {
  using namespace websocketpp::close::status;
  switch (reason) {
    case CloseReason::CLIENT_CLOSED: return normal;
    case CloseReason::COMPANION_EXITED: return going_away;
    case CloseReason::FRAMING_ERROR: return protocol_error;
    case CloseReason::TRANSPORT_ERROR: return internal_endpoint_error;
    case CloseReason::START_FAILED: return internal_endpoint_error;
  }
  __builtin_unreachable();
}

// websocket class
class LspServer : public WsServer {
  SessionRegistry& registry_;
  const Launcher& launcher_;
  const Config& config_;
  std::mutex mtx_;
  std::map<Handle, std::shared_ptr<BridgeSession>, std::owner_less<Handle>> sessions_;

  std::shared_ptr<BridgeSession> Find_(Handle hdl) {
    std::lock_guard lck(mtx_);
    auto it = sessions_.find(hdl);
    return it == sessions_.end() ? nullptr : it->second;
  }
 public:
  LspServer(SessionRegistry& registry, const Launcher& launcher, const Config& config) :
      WsServer(config.listen_address, config.lsp_port, config.max_frame_size),
      registry_(registry), launcher_(launcher), config_(config) {}

  void OnOpen(Handle hdl) override {
    BridgeSession::Client client = {
      .Send = [this, hdl](const std::string& msg) {
        Send(hdl, msg);
      },
      .Close = [this, hdl](CloseReason reason, const std::string& detail) {
        Close(hdl, CloseCodeOf(reason), fmt::format("{}: {}", CloseReasonDesc(reason), detail));
      },
    };
    auto session = std::make_shared<BridgeSession>(registry_, launcher_, config_, std::move(client));
    spdlog::info("Client connected: {}", session->Key());
    std::lock_guard lck(mtx_);
    sessions_.emplace(hdl, std::move(session));
  }

  void OnMessage(Handle hdl, const std::string& msg) override {
    if (auto session = Find_(hdl)) session->OnClientMessage(msg);
  }

  void OnClose(Handle hdl) override {
    std::shared_ptr<BridgeSession> session;
    {
      std::lock_guard lck(mtx_);
      auto it = sessions_.find(hdl);
      if (it == sessions_.end()) return;
      session = std::move(it->second);
      sessions_.erase(it);
    }
    spdlog::info("Client disconnected: {}", session->Key());
    session->OnClientClose();
  }

  void CloseSessions() {
    std::map<Handle, std::shared_ptr<BridgeSession>, std::owner_less<Handle>> sessions;
    {
      std::lock_guard lck(mtx_);
      sessions.swap(sessions_);
    }
    for (auto& [hdl, session] : sessions) {
      Close(hdl, websocketpp::close::status::going_away, "server shutting down");
      session->OnClientClose();
    }
  }
};

std::unique_ptr<SessionRegistry> registry;
std::unique_ptr<Launcher> launcher;
std::unique_ptr<Executor> executor;
std::unique_ptr<httplib::Server> http_server;
std::unique_ptr<LspServer> lsp_server;
std::thread http_thread, lsp_thread;

void SetupHTTP(httplib::Server& svr, const Config& config) {
  svr.set_payload_max_length(config.limits.max_code_size * 8 + 4096);
  svr.Post("/run", [](const httplib::Request& req, httplib::Response& res) {
    std::string body;
    res.status = HandleRunRequest(*executor, req.body, body);
    res.set_content(body, "application/json");
  });
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {} {}", req.remote_addr, req.method, req.path, res.status);
  });
}

} // namespace

bool StartServers(const Config& config) {
  registry = std::make_unique<SessionRegistry>(config.scratch_root);
  launcher = MakeLauncher(config.sandbox);
  executor = std::make_unique<Executor>(config, *registry, *launcher);

  http_server = std::make_unique<httplib::Server>();
  SetupHTTP(*http_server, config);
  if (!http_server->bind_to_port(config.listen_address.c_str(), config.http_port)) {
    spdlog::error("Cannot listen on {}:{}", config.listen_address, config.http_port);
    return false;
  }
  lsp_server = std::make_unique<LspServer>(*registry, *launcher, config);
  if (!lsp_server->Listen()) return false;

  spdlog::info("HTTP server listening on {}:{}", config.listen_address, config.http_port);
  http_thread = std::thread([]() {
    if (!http_server->listen_after_bind()) spdlog::error("HTTP server stopped unexpectedly");
  });
  lsp_thread = std::thread([]() { lsp_server->Run(); });
  return true;
}

void StopServers() {
  if (http_server) http_server->stop();
  if (lsp_server) {
    lsp_server->CloseSessions();
    lsp_server->Stop();
  }
  if (http_thread.joinable()) http_thread.join();
  if (lsp_thread.joinable()) lsp_thread.join();
  if (registry) registry->CloseAll();
  lsp_server.reset();
  http_server.reset();
}

#include "websocket.h"

#include <spdlog/spdlog.h>

namespace {

// control frame payloads are limited to 125 bytes, two of which hold the code
constexpr size_t kMaxCloseReason = 120;

} // namespace

WsServer::WsServer(const std::string& address, int port, size_t max_message_size) :
    address_(address), port_(port) {
  using namespace websocketpp::lib;
  server_.clear_access_channels(websocketpp::log::alevel::all);
  server_.clear_error_channels(websocketpp::log::elevel::all);
  server_.init_asio();
  server_.set_reuse_addr(true);
  server_.set_max_message_size(max_message_size);
  server_.set_open_handler(bind(&WsServer::OnOpen_, this, placeholders::_1));
  server_.set_close_handler(bind(&WsServer::OnClose_, this, placeholders::_1));
  server_.set_message_handler(bind(&WsServer::OnMessage_, this, placeholders::_1, placeholders::_2));
}

bool WsServer::Listen() {
  websocketpp::lib::error_code ec;
  server_.listen(address_, std::to_string(port_), ec);
  if (ec) {
    spdlog::error("Cannot listen on {}:{}: {}", address_, port_, ec.message());
    return false;
  }
  server_.start_accept(ec);
  if (ec) {
    spdlog::error("Cannot accept on {}:{}: {}", address_, port_, ec.message());
    return false;
  }
  spdlog::info("WebSocket server listening on {}:{}", address_, port_);
  return true;
}

void WsServer::Run() {
  server_.run();
}

void WsServer::Stop() {
  websocketpp::lib::error_code ec;
  server_.stop_listening(ec);
  if (ec) spdlog::warn("stop_listening: {}", ec.message());
  server_.stop();
}

bool WsServer::Send(Handle hdl, const std::string& str) {
  websocketpp::lib::error_code ec;
  server_.send(hdl, str, websocketpp::frame::opcode::text, ec);
  if (ec) spdlog::debug("WebSocket send failed: {}", ec.message());
  return !ec;
}

bool WsServer::Close(Handle hdl, CloseCode code, const std::string& reason) {
  websocketpp::lib::error_code ec;
  server_.close(hdl, code, reason.substr(0, kMaxCloseReason), ec);
  if (ec) spdlog::debug("WebSocket close failed: {}", ec.message());
  return !ec;
}

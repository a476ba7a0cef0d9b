#ifndef WEBSOCKET_H_
#define WEBSOCKET_H_

#include <string>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

class WsServer {
 public:
  using Server = websocketpp::server<websocketpp::config::asio>;
  using Handle = websocketpp::connection_hdl;
  using CloseCode = websocketpp::close::status::value;
 private:
  Server server_;
  std::string address_;
  int port_;

  void OnOpen_(Handle hdl) {
    OnOpen(hdl);
  }
  void OnClose_(Handle hdl) {
    OnClose(hdl);
  }
  void OnMessage_(Handle hdl, Server::message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
      Close(hdl, websocketpp::close::status::unsupported_data, "text messages only");
      return;
    }
    OnMessage(hdl, msg->get_payload());
  }

 public:
  WsServer(const std::string& address, int port, size_t max_message_size);
  virtual ~WsServer() = default;

  // Note: these run on the server thread; Send() and Close() may also be called from other threads
  virtual void OnOpen(Handle) {}
  virtual void OnClose(Handle) {}
  virtual void OnMessage(Handle, const std::string&) {}

  bool Listen();
  // Blocks until Stop()
  void Run();
  void Stop();
  bool Send(Handle hdl, const std::string& str);
  bool Close(Handle hdl, CloseCode code, const std::string& reason);
};

#endif // WEBSOCKET_H_

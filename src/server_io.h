#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <grove/config.h>

// Binds the HTTP endpoint (POST /run) and the language server WebSocket endpoint,
// then serves each on its own thread. Returns false if either cannot listen.
bool StartServers(const Config&);

// Stops both servers, closes every bridge session and releases all workspaces
void StopServers();

#endif  // SERVER_IO_H_

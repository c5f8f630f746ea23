#pragma once
#include <atomic>
#include <string>

// Read-only status page of the authority.
// Providers return JSON text; they are called on the HTTP thread.
void status_http_set_config_json_provider(std::string (*fn)());
void status_http_set_status_provider(std::string (*fn)());
void status_http_set_state_provider(std::string (*fn)());
void status_http_set_quit_flag(std::atomic<bool> *quit_flag);
void status_http_set_listen_address(const std::string &addr);

// Serves /, /api/status, /api/config, /api/state and POST /api/quit
// on a detached thread.
void status_http_start_detached(int port);

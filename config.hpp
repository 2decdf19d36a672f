#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "clockSync.hpp"
#include "lobby.hpp"

#include <chrono>
#include <string>

/*
 * ============================================================================
 * CONFIG - Command Line Settings for Server and Client
 * ============================================================================
 *
 * The values that matter for sync (drift thresholds, heartbeat interval,
 * locked head size, grace window) are flags with the usual values as
 * defaults:
 *
 *   stagesync_server [--port P] [--http-port P] [--threads N]
 *                    [--grace-seconds S] [--heartbeat-ms M] [--locked-head K]
 *
 *   stagesync_client <host> <port> [--name N] [--soft S] [--hard H]
 *                    [--reconnect-ms M] [--heartbeat-ms M]
 *
 * Parsing only checks syntax; Validate() checks the values.
 * ============================================================================
 */

struct ServerConfig {
    int port = 9000;
    int httpPort = 9001;  // 0 disables the directory endpoint
    int threads = 2;
    int graceSeconds = 60;
    int heartbeatMs = 2000;
    int lockedHead = 3;

    bool Validate(std::string* error) const;
    LobbyOptions lobbyOptions() const;
};

struct ClientConfig {
    std::string host;
    int port = 0;
    std::string name;
    double softSeconds = 0.3;
    double hardSeconds = 1.0;
    int reconnectMs = 3000;
    int heartbeatMs = 2000;

    bool Validate(std::string* error) const;
    SyncThresholds thresholds() const;
};

bool parseServerArgs(int argc, const char* const argv[], ServerConfig* config, std::string* error);
bool parseClientArgs(int argc, const char* const argv[], ClientConfig* config, std::string* error);

std::string serverUsage(const std::string& program);
std::string clientUsage(const std::string& program);

#endif // CONFIG_HPP

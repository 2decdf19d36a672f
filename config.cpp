#include "config.hpp"

#include <cerrno>
#include <cstdlib>

namespace {

bool parseInt(const std::string& text, int* value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || parsed < -2147483647L || parsed > 2147483647L) {
        return false;
    }
    *value = static_cast<int>(parsed);
    return true;
}

bool parseDouble(const std::string& text, double* value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text.c_str(), &end);
    if (*end != '\0' || errno == ERANGE) {
        return false;
    }
    *value = parsed;
    return true;
}

// Fetches the value after a "--flag"; argv[i] is the flag itself.
bool takeValue(int argc, const char* const argv[], int* i, std::string* value, std::string* error) {
    if (*i + 1 >= argc) {
        *error = std::string("Missing value for ") + argv[*i];
        return false;
    }
    *value = argv[++*i];
    return true;
}

bool badNumber(const std::string& flag, const std::string& value, std::string* error) {
    *error = "Invalid number for " + flag + ": " + value;
    return false;
}

bool validPort(int port) {
    return port > 0 && port <= 65535;
}

}  // namespace

// ============================================================================
// SERVER
// ============================================================================

bool ServerConfig::Validate(std::string* error) const {
    if (!validPort(port)) {
        *error = "port must be in 1..65535";
        return false;
    }
    if (httpPort != 0 && !validPort(httpPort)) {
        *error = "http-port must be 0 or in 1..65535";
        return false;
    }
    if (httpPort == port) {
        *error = "http-port must differ from port";
        return false;
    }
    if (threads < 1) {
        *error = "threads must be at least 1";
        return false;
    }
    if (graceSeconds < 0) {
        *error = "grace-seconds cannot be negative";
        return false;
    }
    if (heartbeatMs < 100) {
        *error = "heartbeat-ms must be at least 100";
        return false;
    }
    if (lockedHead < 1) {
        *error = "locked-head must be at least 1";
        return false;
    }
    return true;
}

LobbyOptions ServerConfig::lobbyOptions() const {
    LobbyOptions options;
    options.memberGrace = std::chrono::seconds(graceSeconds);
    options.stage.heartbeatInterval = std::chrono::milliseconds(heartbeatMs);
    options.stage.lockedHeadSize = static_cast<size_t>(lockedHead);
    return options;
}

bool parseServerArgs(int argc, const char* const argv[], ServerConfig* config, std::string* error) {
    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        std::string value;
        int* target = nullptr;

        if (flag == "--port") {
            target = &config->port;
        } else if (flag == "--http-port") {
            target = &config->httpPort;
        } else if (flag == "--threads") {
            target = &config->threads;
        } else if (flag == "--grace-seconds") {
            target = &config->graceSeconds;
        } else if (flag == "--heartbeat-ms") {
            target = &config->heartbeatMs;
        } else if (flag == "--locked-head") {
            target = &config->lockedHead;
        } else {
            *error = "Unknown argument: " + flag;
            return false;
        }

        if (!takeValue(argc, argv, &i, &value, error)) {
            return false;
        }
        if (!parseInt(value, target)) {
            return badNumber(flag, value, error);
        }
    }
    return true;
}

std::string serverUsage(const std::string& program) {
    return "Usage: " + program +
           " [--port P] [--http-port P] [--threads N] [--grace-seconds S]"
           " [--heartbeat-ms M] [--locked-head K]\n";
}

// ============================================================================
// CLIENT
// ============================================================================

bool ClientConfig::Validate(std::string* error) const {
    if (host.empty()) {
        *error = "host is required";
        return false;
    }
    if (!validPort(port)) {
        *error = "port must be in 1..65535";
        return false;
    }
    if (!(softSeconds > 0.0)) {
        *error = "soft threshold must be positive";
        return false;
    }
    if (!(hardSeconds > softSeconds)) {
        *error = "hard threshold must be larger than the soft threshold";
        return false;
    }
    if (reconnectMs <= 0) {
        *error = "reconnect-ms must be positive";
        return false;
    }
    if (heartbeatMs < 100) {
        *error = "heartbeat-ms must be at least 100";
        return false;
    }
    return true;
}

SyncThresholds ClientConfig::thresholds() const {
    SyncThresholds thresholds;
    thresholds.softSeconds = softSeconds;
    thresholds.hardSeconds = hardSeconds;
    return thresholds;
}

bool parseClientArgs(int argc, const char* const argv[], ClientConfig* config, std::string* error) {
    if (argc < 3) {
        *error = "host and port are required";
        return false;
    }
    config->host = argv[1];
    if (!parseInt(argv[2], &config->port)) {
        return badNumber("port", argv[2], error);
    }

    for (int i = 3; i < argc; ++i) {
        std::string flag = argv[i];
        std::string value;
        if (!takeValue(argc, argv, &i, &value, error)) {
            return false;
        }

        if (flag == "--name") {
            config->name = value;
        } else if (flag == "--soft") {
            if (!parseDouble(value, &config->softSeconds)) {
                return badNumber(flag, value, error);
            }
        } else if (flag == "--hard") {
            if (!parseDouble(value, &config->hardSeconds)) {
                return badNumber(flag, value, error);
            }
        } else if (flag == "--reconnect-ms") {
            if (!parseInt(value, &config->reconnectMs)) {
                return badNumber(flag, value, error);
            }
        } else if (flag == "--heartbeat-ms") {
            if (!parseInt(value, &config->heartbeatMs)) {
                return badNumber(flag, value, error);
            }
        } else {
            *error = "Unknown argument: " + flag;
            return false;
        }
    }
    return true;
}

std::string clientUsage(const std::string& program) {
    return "Usage: " + program +
           " <host> <port> [--name N] [--soft S] [--hard H] [--reconnect-ms M] [--heartbeat-ms M]\n";
}

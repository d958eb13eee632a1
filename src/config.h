#pragma once

#include <string>
#include "constants.h"
#include "docker_client.h"
#include "session.h"

namespace coderun {

// Everything main needs, filled from command-line flags
struct ServerConfig {
    int port = DEFAULT_PORT;
    std::string environment = "development";
    SessionConfig session;
    DockerClientConfig docker;
    bool show_help = false;
};

// Parse command line into config. Returns false with error set on an
// unknown flag, a missing value or an invalid value.
bool parse_args(int argc, const char* const argv[], ServerConfig& config, std::string& error);

std::string usage(const std::string& program);

} // namespace coderun

/*
 * Coderun - Ephemeral Container Code Execution
 * Synchronous and streaming execution of submitted snippets
 */

#include "config.h"
#include "docker_client.h"
#include "execution_service.h"
#include "http_server.h"
#include "logger.h"
#include "session.h"
#include <csignal>
#include <iostream>

using namespace coderun;

int main(int argc, char* argv[]) {
    ServerConfig config;
    std::string error;

    // Parse command line
    if (!parse_args(argc, argv, config, error)) {
        std::cerr << error << std::endl;
        std::cerr << usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    // Writes to a vanished client must fail with EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "Coderun - Ephemeral Container Code Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Environment: " << config.environment << std::endl;
    std::cout << "Image: " << config.session.image << std::endl;
    std::cout << "Timeout: " << config.session.timeout.count() << "ms" << std::endl;
    std::cout << "Docker socket: " << config.docker.socket_path
              << " (API v" << config.docker.api_version << ")" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    DockerClient docker(config.docker);
    try {
        log_info("[Docker] Connected to daemon version " + docker.ping());
    } catch (const std::exception& e) {
        log_warn(std::string("[Docker] Daemon not reachable yet: ") + e.what());
    }

    SessionOrchestrator orchestrator(docker, config.session);
    ExecutionService service(orchestrator, config.environment);

    HttpServer server(config.port);
    service.register_routes(server);

    std::cout << "Starting server on port " << config.port << "..." << std::endl;
    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /v1/execute      - Run source, return combined output" << std::endl;
    std::cout << "  WS   /v1/execute      - Run source, stream output frames" << std::endl;
    std::cout << "  GET  /v1/healthcheck  - Service status" << std::endl;
    std::cout << std::endl;

    try {
        // Start server (blocks)
        server.start();
    } catch (const std::exception& e) {
        log_error(std::string("Server failed: ") + e.what());
        return 1;
    }
    return 0;
}

#include "config.h"

#include <sstream>

namespace coderun {

namespace {

bool parse_int(const std::string& text, int min_value, int max_value, int& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    if (text.size() > 9) return false;
    int value = std::stoi(text);
    if (value < min_value || value > max_value) return false;
    out = value;
    return true;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) words.push_back(word);
    return words;
}

} // namespace

bool parse_args(int argc, const char* const argv[], ServerConfig& config, std::string& error) {
    bool command_given = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }
        if (arg == "--tty") {
            config.session.tty = true;
            continue;
        }

        if (i + 1 >= argc) {
            error = "Missing value for " + arg;
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--port") {
            if (!parse_int(value, 1, 65535, config.port)) {
                error = "Invalid port: " + value;
                return false;
            }
        } else if (arg == "--env") {
            if (value != "development" && value != "staging" && value != "production") {
                error = "Invalid environment: " + value;
                return false;
            }
            config.environment = value;
        } else if (arg == "--timeout") {
            int seconds = 0;
            if (!parse_int(value, 1, 3600, seconds)) {
                error = "Invalid timeout: " + value;
                return false;
            }
            config.session.timeout = std::chrono::seconds(seconds);
        } else if (arg == "--image") {
            config.session.image = value;
        } else if (arg == "--command") {
            std::vector<std::string> command = split_words(value);
            if (command.empty()) {
                error = "Command must not be empty";
                return false;
            }
            config.session.command = command;
            command_given = true;
        } else if (arg == "--workdir") {
            if (value.empty() || value[0] != '/') {
                error = "Working directory must be absolute: " + value;
                return false;
            }
            config.session.working_dir = value;
        } else if (arg == "--filename") {
            if (value.empty() || value.find('/') != std::string::npos) {
                error = "Invalid filename: " + value;
                return false;
            }
            config.session.source_filename = value;
        } else if (arg == "--docker-socket") {
            config.docker.socket_path = value;
        } else if (arg == "--api-version") {
            config.docker.api_version = value;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    if (!command_given) {
        config.session.command = default_command(config.session.source_filename);
    }
    return true;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --port N             Listen port (default " << DEFAULT_PORT << ")\n"
        << "  --env NAME           development|staging|production (default development)\n"
        << "  --timeout SECONDS    Per-request deadline (default " << DEFAULT_TIMEOUT_SECONDS << ")\n"
        << "  --image IMAGE        Container image (default " << DEFAULT_IMAGE << ")\n"
        << "  --command CMD        Entry command, space separated (default \"go run FILENAME\")\n"
        << "  --workdir DIR        Working directory in the container (default " << DEFAULT_WORKING_DIR << ")\n"
        << "  --filename NAME      Name of the injected source file (default " << DEFAULT_SOURCE_FILENAME << ")\n"
        << "  --tty                Allocate a TTY (stdout and stderr merged)\n"
        << "  --docker-socket PATH Docker daemon socket (default " << DEFAULT_DOCKER_SOCKET << ")\n"
        << "  --api-version VER    Docker Engine API version (default " << DEFAULT_DOCKER_API_VERSION << ")\n"
        << "  --help               Show this message\n";
    return out.str();
}

} // namespace coderun

/*
 * sitemirror - mirror a web page and its assets into a zip archive
 *
 * Usage:
 *   ./sitemirror [-c config.json] [-v] <url>...
 *   ./sitemirror [-c config.json] --agent < model_response.txt
 *   ./sitemirror [-c config.json] --api   < request.json
 */

#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/config.hpp>
#include <sitemirror/core/json.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/dispatcher.hpp>
#include <sitemirror/mirror/mirror_config.hpp>
#include <sitemirror/mirror/cloner.hpp>
#include <sitemirror/mirror/clone_tool.hpp>
#include <sitemirror/mirror/clone_endpoint.hpp>

#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <cstring>
#include <curl/curl.h>

namespace sitemirror {

static const char* APP_VERSION = "1.0.0";
static const char* APP_NAME = "sitemirror";

enum RunMode {
    RUN_CLONE,
    RUN_AGENT,
    RUN_API
};

struct Options {
    std::string config_file;
    bool verbose;
    RunMode mode;
    std::vector<std::string> urls;
    
    Options() : verbose(false), mode(RUN_CLONE) {}
};

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <url>...\n"
              << "\n"
              << "Clone web pages (HTML, CSS, JS, images, fonts) into zip archives.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE   JSON configuration file\n"
              << "  -v, --verbose       Debug logging\n"
              << "      --agent         Execute <tool_call> blocks read from stdin\n"
              << "      --api           Answer a clone request body read from stdin\n"
              << "  -h, --help          Show this help\n"
              << "      --version       Show version\n";
}

static void print_version() {
    std::cout << APP_NAME << " " << APP_VERSION << std::endl;
}

// Returns -1 to continue, otherwise the exit status
static int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "--version") == 0) {
            print_version();
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << argv[i] << " requires a file argument\n";
                return 2;
            }
            opts.config_file = argv[++i];
        } else if (strcmp(argv[i], "--agent") == 0) {
            opts.mode = RUN_AGENT;
        } else if (strcmp(argv[i], "--api") == 0) {
            opts.mode = RUN_API;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            opts.urls.push_back(argv[i]);
        }
    }
    
    if (opts.mode == RUN_CLONE && opts.urls.empty()) {
        print_usage(argv[0]);
        return 2;
    }
    return -1;
}

static std::string read_stdin() {
    return std::string((std::istreambuf_iterator<char>(std::cin)),
                       std::istreambuf_iterator<char>());
}

static int run_clone(Cloner& cloner, const std::vector<std::string>& urls) {
    int status = 0;
    for (size_t i = 0; i < urls.size(); ++i) {
        try {
            CloneResult result = cloner.clone_website(urls[i]);
            std::cout << result.to_json().dump(2) << std::endl;
        } catch (const ValidationError& e) {
            LOG_ERROR("%s: %s", urls[i].c_str(), e.what());
            status = 2;
        } catch (const CloneError& e) {
            LOG_ERROR("%s: %s failed: %s", urls[i].c_str(), clone_error_kind_str(e.kind()), e.what());
            if (status == 0) status = 1;
        } catch (const std::exception& e) {
            LOG_ERROR("%s: %s", urls[i].c_str(), e.what());
            if (status == 0) status = 1;
        }
    }
    return status;
}

static int run_agent(Cloner& cloner, const Config& config) {
    CloneTool tool(cloner);
    if (!tool.init(config)) {
        LOG_ERROR("Failed to initialize %s tool", tool.name());
        return 1;
    }
    
    ToolDispatcher dispatcher(DispatcherConfig::from_config(config));
    dispatcher.register_provider(tool);
    
    std::string response = read_stdin();
    std::vector<ParsedToolCall> calls = dispatcher.parse_tool_calls(response);
    if (calls.empty()) {
        std::cout << dispatcher.build_tools_prompt();
        tool.shutdown();
        return 0;
    }
    
    bool all_ok = true;
    for (size_t i = 0; i < calls.size(); ++i) {
        AgentToolResult result = dispatcher.execute_tool(calls[i]);
        if (!result.success) all_ok = false;
        std::cout << dispatcher.format_tool_result(calls[i].tool_name, result) << std::endl;
    }
    tool.shutdown();
    return all_ok ? 0 : 1;
}

static int run_api(Cloner& cloner) {
    CloneEndpoint endpoint(cloner);
    
    std::string input = read_stdin();
    EndpointResponse resp;
    try {
        resp = endpoint.handle(Json::parse(input));
    } catch (const Json::parse_error& e) {
        LOG_WARN("Request body is not JSON: %s", e.what());
        resp = endpoint.handle(Json());
    }
    
    Json out = Json::object();
    out["status"] = resp.status;
    out["body"] = resp.body;
    std::cout << out.dump(2) << std::endl;
    return resp.status == 200 ? 0 : (resp.status == 400 ? 2 : 1);
}

} // namespace sitemirror

int main(int argc, char* argv[]) {
    using namespace sitemirror;
    
    Options opts;
    int early = parse_args(argc, argv, opts);
    if (early >= 0) {
        return early;
    }
    
    Config config;
    if (!opts.config_file.empty() && !config.load_file(opts.config_file)) {
        LOG_ERROR("Cannot load config file: %s", opts.config_file.c_str());
        return 1;
    }
    
    Logger::instance().set_level(opts.verbose ? LogLevel::DEBUG
                                              : parse_log_level(config.get_string("log_level", "info")));
    
    curl_global_init(CURL_GLOBAL_ALL);
    
    int status = 1;
    {
        Cloner cloner(MirrorConfig::from_config(config));
        switch (opts.mode) {
            case RUN_CLONE: status = run_clone(cloner, opts.urls); break;
            case RUN_AGENT: status = run_agent(cloner, config); break;
            case RUN_API:   status = run_api(cloner); break;
        }
    }
    
    curl_global_cleanup();
    return status;
}

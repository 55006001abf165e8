//
//  main.cpp
//  DAVBridge
//
//  Serves KodBox projects and tasks to CalDAV clients.
//

#include <iostream>
#include <string>
#include <functional>
#include <pthread.h>
#include <signal.h>

#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "optionparser.h"

#include "davbridge/bridge_config.hpp"
#include "davbridge/caldav_handler.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/cache_store.hpp"
#include "davbridge/http_server.hpp"
#include "davbridge/kodbox_client.hpp"
#include "davbridge/logging.hpp"
#include "davbridge/sync_engine.hpp"
#include "davbridge/sync_exception.hpp"
#include "davbridge/thread_utils.hpp"

using namespace std;
using nlohmann::json;
using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: davbridge [options]\n\nConfiguration is read from --config (or config.json, config/config.json,\n/etc/davbridge/config.json) and overridden by environment variables.\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, CONFIG, MODE, PORT, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"h", "help",    CArg::None,      "  --help, -h  \tPrint usage and exit." },
    {CONFIG,  0,"c", "config",  CArg::Required,  "  --config, -c  \tOptional: path to the JSON config file." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tOptional: serve (default), sync, test, or config." },
    {PORT,    0,"p", "port",    CArg::Required,  "  --port, -p  \tOptional: HTTP port, overrides server.port." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log at debug level." },
    {0,0,0,0,0,0}
};

int runSingleFunctionAndExit(std::function<json()> fn) {
    json resp = {{"error", nullptr}};
    int code = 0;
    try {
        resp["result"] = fn();
    } catch (SyncException & ex) {
        resp["error"] = ex.toJSON();
        code = 1;
    } catch (std::exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    cout << resp.dump(2) << "\n";
    return code;
}

int runServe(const BridgeConfig & config, shared_ptr<UpstreamClient> upstream) {
    auto logger = Logging::get("logger");

    // SIGINT / SIGTERM are handled by sigwait on the main thread; block them
    // before any thread is started so every thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto store = make_shared<CacheStore>(config.historyDepth);
    auto engine = make_shared<SyncEngine>(upstream, store, config.sync);
    auto handler = make_shared<CalDAVHandler>(store, config.caldav, [engine]() {
        return engine->statusJSON();
    });
    HTTPServer server(config.server, handler);

    server.start();
    engine->start();
    logger->info("------------- DAVBridge serving {} on port {} ---------------", config.kodbox.baseURL, server.port());

    int received = 0;
    sigwait(&signals, &received);
    logger->info("Received signal {}, shutting down", received);

    engine->stop();
    server.stop();
    logger->info("Shutdown complete");
    return 0;
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error()) {
        return 1;
    }
    if (options[HELP] || options[UNKNOWN]) {
        option::printUsage(std::cout, usage);
        return options[HELP] ? 0 : 1;
    }

    string mode = options[MODE] ? string(options[MODE].arg) : "serve";
    if (mode != "serve" && mode != "sync" && mode != "test" && mode != "config") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    BridgeConfig config;
    try {
        config = BridgeConfig::load(options[CONFIG] ? options[CONFIG].arg : "", BridgeConfig::processEnvironment);
        if (options[PORT]) {
            string port = options[PORT].arg;
            if (port == "" || port.find_first_not_of("0123456789") != string::npos || port.size() > 5 || stoi(port) > 65535) {
                throw ConfigException("--port must be a number between 1 and 65535");
            }
            config.server.port = (unsigned short)stoi(port);
        }
        if (options[VERBOSE]) {
            config.logging.level = "debug";
        }
        if (mode != "config") {
            config.validate(mode == "serve");
        }
    } catch (ConfigException & ex) {
        cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    if (mode == "config") {
        cout << config.toJSON().dump(2) << "\n";
        return 0;
    }

    Logging::configure(config.logging);
    curl_global_init(CURL_GLOBAL_ALL);

    auto kodbox = make_shared<KodBoxClient>(config.kodbox);
    int code = 0;

    if (mode == "test") {
        code = runSingleFunctionAndExit([&]() {
            return kodbox->testConnection();
        });
    } else if (mode == "sync") {
        code = runSingleFunctionAndExit([&]() {
            auto store = make_shared<CacheStore>(config.historyDepth);
            SyncSettings settings = config.sync;
            settings.eager = false;
            SyncEngine engine(kodbox, store, settings);
            CycleOutcome outcome = engine.runCycle();
            if (outcome != CycleOutcome::Published) {
                throw SyncException(ERROR_UPSTREAM_UNAVAILABLE, "Sync cycle " + SyncEngine::outcomeToString(outcome) + ": " + engine.status().lastError, false);
            }
            return json({
                {"outcome", SyncEngine::outcomeToString(outcome)},
                {"snapshot", store->current()->toJSON()},
            });
        });
    } else {
        try {
            code = runServe(config, kodbox);
        } catch (std::exception & ex) {
            Logging::get("logger")->critical("Fatal error: {}", ex.what());
            code = 1;
        }
    }

    curl_global_cleanup();
    Logging::shutdown();
    return code;
}

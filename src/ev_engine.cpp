/**
 * ev_engine — Headless EV survival / KO simulation engine.
 *
 * One-shot mode reads a single run request, evaluates it and writes the
 * response stream (progress lines, then one terminal line). Worker mode
 * speaks the same JSON Lines protocol over stdin/stdout and accepts
 * cancel messages between batches.
 *
 * Usage:
 *   ev_engine --data <catalog.json> --request <request.json>
 *             [--output <path>] [--verbose]
 *   ev_engine --data <catalog.json> --serve [--verbose]
 */

#include "core/errors.hpp"
#include "damage/standard_calculator.hpp"
#include "data/game_data.hpp"
#include "io/json_reader.hpp"
#include "io/line_channel.hpp"
#include "io/request_parser.hpp"
#include "io/response_writer.hpp"
#include "worker/job_orchestrator.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace {

struct EngineConfig {
    std::string data_path;
    std::string request_path;
    std::string output_path;        // empty = stdout
    bool serve = false;
    bool verbose = false;

    int batch_size = evsim::worker::DEFAULT_BATCH_SIZE;
    long long timeout_ms = evsim::worker::DEFAULT_TIMEOUT_MS;
    size_t cache_capacity = evsim::damage::DEFAULT_CACHE_CAPACITY;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --data <path> (--request <path> | --serve) [options]\n"
              << "\n"
              << "Modes:\n"
              << "  --request <path>     Run one request file and exit\n"
              << "  --serve              JSON Lines worker on stdin/stdout\n"
              << "\n"
              << "Options:\n"
              << "  --data <path>        Species/move catalog JSON (required)\n"
              << "  --output <path>      Response file (default: stdout)\n"
              << "  --batch N            Grid points per batch (default: 100)\n"
              << "  --timeout MS         Job timeout in ms (default: 30000)\n"
              << "  --cache N            Damage cache capacity (default: 512)\n"
              << "  --verbose            Diagnostics to stderr\n"
              << "  --help               Show this message\n";
}

/// Request id of a message that failed to parse, when one can be found.
std::string salvage_request_id(const evsim::JsonValue& message) {
    return message["payload"]["requestId"].get_string();
}

void write_error(std::ostream& out, const std::string& request_id, const std::string& message) {
    evsim::worker::JobResponse response;
    response.type = evsim::worker::ResponseType::ERROR;
    response.request_id = request_id;
    response.error = message;
    evsim::ResponseWriter::write(out, response);
}

/**
 * Handle one incoming line. Run requests are started, cancel requests
 * flag the active job; anything malformed is answered with an error.
 */
void dispatch_line(const std::string& line, evsim::worker::JobOrchestrator& orchestrator,
                   std::ostream& out, const EngineConfig& config) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;

    evsim::JsonValue message;
    try {
        message = evsim::JsonReader::parse(line);
    } catch (const std::exception& e) {
        write_error(out, "", std::string("Malformed message: ") + e.what());
        return;
    }

    evsim::HostMessage parsed;
    try {
        parsed = evsim::RequestParser::parse_message(message);
    } catch (const evsim::ConfigurationError& e) {
        write_error(out, salvage_request_id(message), e.what());
        return;
    }

    if (parsed.type == evsim::MessageType::CANCEL) {
        if (!orchestrator.cancel(parsed.request_id) && config.verbose) {
            std::cerr << "[Worker] Ignoring cancel for inactive job " << parsed.request_id << "\n";
        }
        return;
    }

    if (config.verbose) {
        std::cerr << "[Worker] Run request " << parsed.request_id << ": "
                  << parsed.request.scenario.turns.size() << " turns, "
                  << parsed.request.combatants.player.species << " vs "
                  << parsed.request.combatants.opponent.species << "\n";
    }
    orchestrator.start(parsed.request);
}

int serve(evsim::worker::JobOrchestrator& orchestrator, const EngineConfig& config) {
    evsim::LineChannel input(0);
    std::string line;

    while (input.read_line(line)) {
        dispatch_line(line, orchestrator, std::cout, config);

        // Between batches, drain whatever arrived without blocking
        while (orchestrator.resume()) {
            while (input.poll_line(line, 0)) {
                dispatch_line(line, orchestrator, std::cout, config);
            }
        }
    }

    if (config.verbose) std::cerr << "[Worker] Input closed, exiting\n";
    return 0;
}

int run_request(evsim::worker::JobOrchestrator& orchestrator, const EngineConfig& config,
                std::ostream& out) {
    evsim::JsonValue root;
    try {
        root = evsim::JsonReader::parse_file(config.request_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading request: " << e.what() << "\n";
        return 1;
    }

    // Accept either a full {"type":"run","payload":...} envelope or a bare payload
    const evsim::JsonValue& payload = root.has("payload") ? root["payload"] : root;

    evsim::worker::JobRequest request;
    try {
        request = evsim::RequestParser::parse_request(payload);
    } catch (const evsim::ConfigurationError& e) {
        write_error(out, payload["requestId"].get_string(), e.what());
        return 1;
    }

    if (!orchestrator.start(request)) return 1;
    orchestrator.run();
    return orchestrator.last_state() == evsim::worker::JobState::COMPLETE ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    EngineConfig config;

    // Parse CLI arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--data" && i + 1 < argc) {
                config.data_path = argv[++i];
            } else if (arg == "--request" && i + 1 < argc) {
                config.request_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                config.output_path = argv[++i];
            } else if (arg == "--serve") {
                config.serve = true;
            } else if (arg == "--batch" && i + 1 < argc) {
                config.batch_size = std::stoi(argv[++i]);
            } else if (arg == "--timeout" && i + 1 < argc) {
                config.timeout_ms = std::stoll(argv[++i]);
            } else if (arg == "--cache" && i + 1 < argc) {
                config.cache_capacity = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (config.data_path.empty() || (config.request_path.empty() && !config.serve)) {
        std::cerr << "Error: --data and one of --request / --serve are required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Load catalog
    evsim::data::JsonGameData catalog;
    try {
        catalog = evsim::data::JsonGameData::load_file(config.data_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading catalog: " << e.what() << "\n";
        return 1;
    }

    if (config.verbose) {
        std::cerr << "=== EV Engine ===\n"
                  << "Catalog: " << config.data_path << " ("
                  << catalog.species_count() << " species, "
                  << catalog.move_count() << " moves)\n"
                  << "Mode: " << (config.serve ? "serve" : "request") << "\n"
                  << "Batch: " << config.batch_size << "\n"
                  << "Timeout: " << config.timeout_ms << "ms\n"
                  << "Cache: " << config.cache_capacity << " entries\n\n";
    }

    evsim::damage::StandardDamageCalculator calculator(catalog);

    evsim::worker::OrchestratorConfig orch_config;
    orch_config.default_batch_size = config.batch_size;
    orch_config.default_timeout_ms = config.timeout_ms;
    orch_config.cache_capacity = config.cache_capacity;
    orch_config.verbose = config.verbose;

    if (config.serve) {
        evsim::worker::JobOrchestrator orchestrator(
            catalog, calculator,
            [](const evsim::worker::JobResponse& r) { evsim::ResponseWriter::write(std::cout, r); },
            orch_config);
        return serve(orchestrator, config);
    }

    std::ofstream file;
    if (!config.output_path.empty()) {
        file.open(config.output_path);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
            return 1;
        }
    }
    std::ostream& out = config.output_path.empty() ? std::cout : file;

    auto t_start = std::chrono::steady_clock::now();

    evsim::worker::JobOrchestrator orchestrator(
        catalog, calculator,
        [&out](const evsim::worker::JobResponse& r) { evsim::ResponseWriter::write(out, r); },
        orch_config);
    int status = run_request(orchestrator, config, out);

    if (config.verbose) {
        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - t_start).count();
        std::cerr << "\nFinished (" << evsim::worker::state_to_string(orchestrator.last_state())
                  << ") in " << elapsed << "s\n";
        if (!config.output_path.empty()) {
            std::cerr << "Written to: " << config.output_path << "\n";
        }
    }
    return status;
}

#include "config.hpp"
#include "chunk_processor.hpp"
#include "transcript.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>
#include <stdexcept>

static void print_usage() {
    std::cout << "Usage: chunkflow [options] [FILE]\n"
              << "\n"
              << "Replays a recorded model stream (SSE or JSON lines) through the\n"
              << "chunk processor and prints each event as one JSON line.\n"
              << "Reads stdin when FILE is omitted or '-'.\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Use config file PATH (default: ~/.chunkflow/config.json)\n"
              << "  --no-batching        Disable content batching\n"
              << "  --no-sanitize        Pass content through unsanitized\n"
              << "  --metrics            Print stream metrics JSON to stderr at the end\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  CHUNKFLOW_CHUNK_TIMEOUT_MS     Inter-chunk timeout (0 disables)\n"
              << "  CHUNKFLOW_MAX_PENDING_EVENTS   Backpressure threshold\n"
              << "  CHUNKFLOW_DISABLE_BATCHING     Set to 1 to disable batching\n"
              << "  CHUNKFLOW_DISABLE_SANITIZE     Set to 1 to disable sanitizing\n";
}

static void print_events(const std::vector<chunkflow::StreamEvent>& events) {
    for (const auto& ev : events) {
        std::cout << chunkflow::event_to_json(ev).dump() << '\n';
    }
}

static void replay(std::istream& in, chunkflow::ChunkProcessor& processor) {
    chunkflow::TranscriptReader reader;
    auto on_delta = [&processor](const chunkflow::Delta& delta) {
        print_events(processor.process_delta(delta));
        // The console consumes instantly, so queued events go out right away
        print_events(processor.drain());
        return true;
    };

    processor.start_round();

    char buf[4096];
    while (!reader.done() && in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        reader.feed(std::string(buf, static_cast<size_t>(n)), on_delta);
    }
    if (in.bad()) {
        throw std::runtime_error("read error on input");
    }
    reader.finish(on_delta);

    print_events(processor.finish());
    print_events(processor.drain());

    if (reader.malformed_lines() > 0) {
        std::cerr << "[chunkflow] Skipped " << reader.malformed_lines()
                  << " malformed line(s), replayed " << reader.deltas_read() << "\n";
    }
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string config_path;
    std::string input_path;
    bool no_batching = false;
    bool no_sanitize = false;
    bool show_metrics = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--no-batching") == 0) {
            no_batching = true;
        } else if (std::strcmp(argv[i], "--no-sanitize") == 0) {
            no_sanitize = true;
        } else if (std::strcmp(argv[i], "--metrics") == 0) {
            show_metrics = true;
        } else if (input_path.empty() && (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0)) {
            input_path = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? chunkflow::StreamConfig::load()
                                      : chunkflow::StreamConfig::load(config_path);

    // Override config with CLI args
    if (no_batching) {
        config.enable_batching = false;
    }
    if (no_sanitize) {
        config.sanitize = false;
    }

    chunkflow::ChunkProcessor processor(config);

    if (input_path.empty() || input_path == "-") {
        replay(std::cin, processor);
    } else {
        std::ifstream file(input_path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("cannot open " + input_path);
        }
        replay(file, processor);
    }

    if (show_metrics) {
        std::cerr << processor.metrics().to_json().dump(2) << '\n';
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

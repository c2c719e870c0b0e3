/// @file fenprobe.cpp
/// Command-line driver: find random positions the engine accepts and print
/// their evaluations.

#include <fenprobe/engine_session.hpp>
#include <fenprobe/executable.hpp>
#include <fenprobe/search.hpp>
#include <fenprobe/search_config.hpp>

#include <unistd.h>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace {

void trace_to_stderr(fenprobe::TraceEvent event, std::string_view text) {
    switch (event) {
        case fenprobe::TraceEvent::Send:
            std::cerr << "> ";
            break;
        case fenprobe::TraceEvent::Receive:
            std::cerr << "< ";
            break;
        case fenprobe::TraceEvent::Note:
            std::cerr << "# ";
            break;
    }
    std::cerr << text << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    const std::string_view program = argc > 0 ? argv[0] : "fenprobe";

    fenprobe::SearchConfig config;
    try {
        config = fenprobe::parse_command_line(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << fenprobe::usage(program);
        return 2;
    }
    if (config.show_help) {
        std::cout << fenprobe::usage(program);
        return 0;
    }

    auto executable = fenprobe::resolve_executable(config.executables);
    if (!executable) {
        std::cout << "Please specify path to the Stockfish executable using the --executable "
                     "command line argument."
                  << std::endl;
        return 1;
    }

    // Escape codes only make sense on a terminal.
    if (!::isatty(STDOUT_FILENO))
        config.highlight = false;

    fenprobe::EngineOptions options;
    options.executable = executable->string();
    if (config.verbose)
        options.trace = trace_to_stderr;

    try {
        fenprobe::EngineSession session(std::move(options));
        session.start();

        fenprobe::PositionSearch search(session, config, std::cout);
        if (config.verbose) {
            while (search.stats().found < config.count) {
                if (search.step())
                    std::cerr << search.board().diagram();
            }
        } else {
            search.run();
        }
        const fenprobe::SearchStats& stats = search.stats();

        session.stop();

        if (config.verbose) {
            std::cerr << "# generated " << stats.generated << ", faults " << stats.faults
                      << ", in check " << stats.in_check << ", found " << stats.found
                      << ", restarts " << session.restart_count() << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

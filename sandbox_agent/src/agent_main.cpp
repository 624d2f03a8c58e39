#include "action/action.hpp"
#include "agent_config.hpp"
#include "agent_state.hpp"
#include "logger.hpp"
#include "stdio_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  --config <file>          log4cplus configuration (default log4cplus.ini)\n"
              << "  --shell <path>           shell used for executeCommand (default /bin/bash)\n"
              << "  --claude <path>          claude CLI executable (default claude)\n"
              << "  --workers <n>            concurrent request handlers (default 4)\n"
              << "  --agent-timeout <ms>     runClaudeCode timeout (default 300000)\n"
              << "  --pdeathsig              exit when the parent process dies\n"
              << "  -v, --version            print version and exit\n";
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    AgentConfig config;
    try {
        config = parse_command_line(argc, argv);
    } catch (const std::invalid_argument& exc) {
        std::cerr << exc.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (config.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    // Termination signals are consumed by a dedicated thread; block them before any thread starts.
    ::signal(SIGPIPE, SIG_IGN);
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGTERM);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    init_logging(config.log_config_path);

    LOG4CPLUS_INFO(core_logger(), "sandbox_agent starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Shell: " << config.shell << ", claude: " << config.claude_executable);
    LOG4CPLUS_INFO(core_logger(), "Workers: " << config.worker_threads);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (config.enable_pdeathsig ? "enabled" : "disabled"));

    int exit_code = 0;
    try {
        AgentState state(config);

        ipc::StdioServer server(
            STDIN_FILENO, STDOUT_FILENO,
            [&state](const std::string& line) { return ipc::actions::handle_action(line, state); },
            config.worker_threads);

        std::thread([&server, stop_signals]() {
            int signo = 0;
            if (sigwait(&stop_signals, &signo) == 0) {
                LOG4CPLUS_INFO(core_logger(), "Received signal " << signo << " (" << strsignal(signo) << ")");
                server.stop();
            }
        }).detach();

        if (!server.run()) {
            LOG4CPLUS_ERROR(core_logger(), "Transport failed");
            exit_code = 1;
        }

        state.processes().terminate_all();
        LOG4CPLUS_INFO(core_logger(), "sandbox_agent exiting with code " << exit_code);

        // Workers may still be finishing requests; leave without joining them.
        std::_Exit(exit_code);
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Fatal error: " << exc.what());
        exit_code = 1;
    }

    return exit_code;
}

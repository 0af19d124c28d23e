#include "audio_io.h"
#include "config.h"
#include "display_model.h"
#include "event_loop.h"
#include "logger.h"
#include "session_controller.h"
#include "transport/websocket_session.h"
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace calcvox {

static std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int) {
    g_shutdown_requested = true;
}

namespace {

const char* state_label(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected: return "Live";
        case ConnectionState::Connecting: return "Connecting...";
        case ConnectionState::Error: return "Error";
        case ConnectionState::Disconnected: return "Offline";
    }
    return "Offline";
}

void print_history(const DisplayModel& display, size_t count) {
    if (display.history().empty()) {
        std::cout << "  (no history)\n";
        return;
    }
    for (const auto& line : display.history().latest(count)) {
        std::cout << "  " << line << "\n";
    }
}

void print_help() {
    std::cout << "Commands: t = start/stop listening, r = reset, h = history, q = quit\n";
}

std::string default_config_path() {
    std::string path = "config/config.json";
    // Prefer <exe dir>/../config/config.json when run from a build directory
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                path = candidate;
            }
        }
    }
    return path;
}

/// Reads commands from stdin and hands them to the event loop
void stdin_reader(EventLoop& loop, SessionController& controller, DisplayModel& display,
                  const std::atomic<bool>& running) {
    std::string line;
    while (running) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;
        }
        if (!std::getline(std::cin, line)) {
            loop.post([&loop]() { loop.quit(); });
            return;
        }
        if (line.empty()) {
            continue;
        }
        char command = line[0];
        loop.post([&loop, &controller, &display, command]() {
            switch (command) {
                case 't':
                    controller.toggle_connection();
                    break;
                case 'r':
                    controller.manual_reset();
                    break;
                case 'h':
                    print_history(display, HISTORY_LIMIT);
                    break;
                case 'q':
                    loop.quit();
                    break;
                default:
                    print_help();
                    break;
            }
        });
    }
}

} // namespace

} // namespace calcvox

int main(int argc, char* argv[]) {
    calcvox::Logger::initialize(calcvox::LogLevel::INFO);

    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        calcvox::PortAudioDeviceFactory::list_devices();
        calcvox::Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? std::string(argv[1]) : calcvox::default_config_path();
    calcvox::Config config = calcvox::Config::load_from_file(config_path);

    calcvox::Logger::shutdown();
    calcvox::Logger::initialize(calcvox::parse_log_level(config.logging.level), config.logging.file);

    calcvox::EventLoop loop;
    calcvox::DisplayModel display;
    calcvox::PortAudioDeviceFactory devices;
    calcvox::transport::WebSocketConnector connector(loop, config.session);
    calcvox::SessionController controller(config, devices, connector, display);

    display.set_listener([&display](calcvox::DisplayModel::Field field) {
        switch (field) {
            case calcvox::DisplayModel::Field::Expression:
                std::cout << "  > " << display.expression() << "\n";
                break;
            case calcvox::DisplayModel::Field::Result:
                std::cout << "  = " << display.result() << "\n";
                break;
            case calcvox::DisplayModel::Field::History:
                calcvox::print_history(display, calcvox::HISTORY_PREVIEW_COUNT);
                break;
            case calcvox::DisplayModel::Field::Connection:
                std::cout << "[" << calcvox::state_label(display.connection_state()) << "]\n";
                break;
        }
        std::cout.flush();
    });

    std::signal(SIGINT, calcvox::signal_handler);
    std::signal(SIGTERM, calcvox::signal_handler);

    std::cout << "AI Voice Calculator  [" << calcvox::state_label(display.connection_state()) << "]\n"
              << "  = " << display.result() << "\n";
    calcvox::print_help();

    std::atomic<bool> reader_running(true);
    std::thread reader(calcvox::stdin_reader, std::ref(loop), std::ref(controller),
                       std::ref(display), std::cref(reader_running));

    loop.run([&]() {
        if (calcvox::g_shutdown_requested) {
            calcvox::Logger::info("Shutting down...");
            loop.quit();
            return;
        }
        controller.poll();
    });

    reader_running = false;
    if (reader.joinable()) {
        reader.join();
    }

    controller.stop();
    loop.run_pending();
    calcvox::Logger::shutdown();
    return 0;
}

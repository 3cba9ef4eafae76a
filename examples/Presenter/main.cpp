/**
 * @file main.cpp
 * @brief Presenter example: runs a session server
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Usage: lectern_presenter [config-file]
 */

#include <Lectern/Core/Config.hpp>
#include <Lectern/Core/Logger.hpp>
#include <Lectern/Core/NetworkConfig.hpp>
#include <Lectern/Core/SessionServer.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace Lectern;

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running = false;
}

class ConsoleListener : public Session::ServerListener {
public:
    void onParticipantConnected(const Session::ParticipantInfo& participant) override {
        std::cout << "[+] " << participant.name << " (" << participant.id << ")" << std::endl;
    }

    void onParticipantDisconnected(const std::string& participantId) override {
        std::cout << "[-] " << participantId << std::endl;
    }

    void onMessage(const std::string& participantId, const Protocol::Message& message) override {
        std::cout << "[" << participantId << "] " << message.type << " " << message.data.dump() << std::endl;
    }
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    Core::Logger::Instance().Initialize(Core::LogLevel::Info, Core::LogOutput::Console);

    Config::ServerConfig config;
    if (argc > 1) {
        Config::ConfigLoader loader;
        Result<Config::ConfigMap> loaded = loader.load(argv[1]);
        if (loaded.isFailure()) {
            std::cerr << "Failed to load " << argv[1] << ": " << getErrorMessage(loaded.error()) << std::endl;
            return 1;
        }

        Result<Config::ServerConfig> parsed = Config::makeServerConfig(loaded.value());
        if (parsed.isFailure()) {
            std::cerr << "Invalid configuration: " << getErrorMessage(parsed.error()) << std::endl;
            return 1;
        }
        config = parsed.value();
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "========================================" << std::endl;
    std::cout << "  Lectern Presenter" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    Session::SessionServer server(config, std::make_shared<ConsoleListener>());

    VoidResult started = server.start();
    if (started.isFailure()) {
        std::cerr << "Failed to start server on port " << config.port << ": "
                  << getErrorMessage(started.error()) << std::endl;
        return 1;
    }

    std::cout << "Presenter:  " << config.presenterName << std::endl;
    std::cout << "Channel:    " << config.channel << std::endl;
    std::cout << "Port:       " << server.port() << std::endl;
    std::cout << "Discovery:  " << config.presence.group << ":" << config.presence.port << std::endl;
    std::cout << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    auto lastNotice = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto now = std::chrono::steady_clock::now();
        if (now - lastNotice >= std::chrono::seconds(30)) {
            lastNotice = now;
            size_t delivered = server.broadcast(
                Protocol::MessageType::ChatMessage,
                Protocol::MessageBuilder::chatMessage("presenter", config.presenterName,
                                                      "Session is running"));
            Session::SessionServer::Statistics stats = server.statistics();
            std::cout << "Notice sent to " << delivered << " participant(s); "
                      << stats.messagesReceived << " received, "
                      << stats.totalConnections << " connections so far" << std::endl;
        }
    }

    std::cout << "Shutting down..." << std::endl;
    server.stop();
    Core::Logger::Instance().Shutdown();
    return 0;
}

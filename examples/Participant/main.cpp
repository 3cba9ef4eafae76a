/**
 * @file main.cpp
 * @brief Participant example: discovers a presenter and joins its session
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Usage: lectern_participant [config-file]
 *
 * With `client.server_address` (and optionally `server.port`) set in the
 * configuration, discovery is skipped and that server is contacted directly.
 */

#include <Lectern/Core/Config.hpp>
#include <Lectern/Core/Logger.hpp>
#include <Lectern/Core/NetworkConfig.hpp>
#include <Lectern/Core/SessionClient.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace Lectern;

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running = false;
}

class ConsoleListener : public Session::ClientListener {
public:
    void onConnected(const std::string& participantId) override {
        std::cout << "Joined session as " << participantId << std::endl;
    }

    void onDisconnected() override {
        std::cout << "Left session" << std::endl;
    }

    void onMessage(const Protocol::Message& message) override {
        std::cout << "[" << message.timestamp << "] " << message.type << " " << message.data.dump() << std::endl;
    }

    void onPresenterFound(const Network::PresenterInfo& presenter) override {
        std::cout << "Found presenter " << presenter.name << " on channel " << presenter.channel
                  << " at " << presenter.id << std::endl;
    }
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    Core::Logger::Instance().Initialize(Core::LogLevel::Info, Core::LogOutput::Console);

    Config::ClientConfig config;
    std::optional<std::string> serverAddress;
    uint16_t serverPort = Config::DEFAULT_SESSION_PORT;

    if (argc > 1) {
        Config::ConfigLoader loader;
        Result<Config::ConfigMap> loaded = loader.load(argv[1]);
        if (loaded.isFailure()) {
            std::cerr << "Failed to load " << argv[1] << ": " << getErrorMessage(loaded.error()) << std::endl;
            return 1;
        }

        Result<Config::ClientConfig> parsed = Config::makeClientConfig(loaded.value());
        if (parsed.isFailure()) {
            std::cerr << "Invalid configuration: " << getErrorMessage(parsed.error()) << std::endl;
            return 1;
        }
        config = parsed.value();

        serverAddress = Config::getString(loaded.value(), "client.server_address");
        if (std::optional<int64_t> port = Config::getInt(loaded.value(), "server.port")) {
            if (*port <= 0 || *port > 65535) {
                std::cerr << "Invalid server.port" << std::endl;
                return 1;
            }
            serverPort = static_cast<uint16_t>(*port);
        }
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "========================================" << std::endl;
    std::cout << "  Lectern Participant" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    Session::SessionClient client(config, std::make_shared<ConsoleListener>());
    std::cout << "Name:       " << config.participantName << std::endl;
    std::cout << "Machine id: " << client.machineId() << std::endl;
    std::cout << std::endl;

    if (!serverAddress) {
        VoidResult discovering = client.startDiscovery();
        if (discovering.isFailure()) {
            std::cerr << "Discovery failed: " << getErrorMessage(discovering.error()) << std::endl;
            return 1;
        }
        std::cout << "Looking for presenters (Ctrl+C to stop)..." << std::endl;
    }

    while (g_running) {
        if (!client.isConnected()) {
            Result<std::string> joined = ErrorCode::NotConnected;

            if (serverAddress) {
                joined = client.connect(*serverAddress, serverPort);
            } else {
                std::vector<Network::PresenterInfo> presenters = client.availablePresenters();
                if (!presenters.empty()) {
                    joined = client.connect(presenters.front());
                }
            }

            if (joined.isFailure() && joined.error() != ErrorCode::NotConnected) {
                std::cerr << "Connection attempt failed: " << getErrorMessage(joined.error()) << std::endl;
                std::this_thread::sleep_for(std::chrono::seconds(2));
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    Session::SessionClient::Statistics stats = client.statistics();
    std::cout << "Shutting down... sent " << stats.messagesSent << " / received "
              << stats.messagesReceived << " messages" << std::endl;

    client.stop();
    Core::Logger::Instance().Shutdown();
    return 0;
}

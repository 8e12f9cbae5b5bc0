#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <string>
#include <vector>
#include "chatRelay.hpp"
#include "config.hpp"
#include "fileSink.hpp"
#include "peerFanoutManager.hpp"
#include "tcpRendezvous.hpp"
#include "transferReceiver.hpp"

std::atomic<bool> g_running{true};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int signum) {
    static bool already_shutting_down = false;

    if (already_shutting_down) {
        std::cout << "\nForced shutdown..." << std::endl;
        exit(signum);
    }

    already_shutting_down = true;
    std::cout << "\nInterrupt signal (" << signum << ") received. Shutting down..." << std::endl;
    g_running = false;
}

static void waitForEnter() {
    std::cout << "\nPress Enter to continue...";
    std::cin.ignore();
    std::cin.get();
}

/**
 * Shares files until Ctrl+C
 */
static void shareFiles(const EngineConfig& config) {
    std::string port;
    std::cout << "Enter port to share on: ";
    std::cin >> port;

    std::vector<std::string> paths;
    std::cout << "Enter file paths, then a single '.' to finish:" << std::endl;
    std::string path;
    while (std::cin >> path && path != ".") {
        paths.push_back(path);
    }

    int expiry_choice = 4;
    std::cout << "Share expires after: 1. 10 minutes  2. 1 hour  3. 1 day  4. Never" << std::endl;
    std::cout << "Choice: ";
    std::cin >> expiry_choice;

    ExpiryPreset preset = ExpiryPreset::NEVER;
    if (expiry_choice == 1) {
        preset = ExpiryPreset::TEN_MINUTES;
    }
    else if (expiry_choice == 2) {
        preset = ExpiryPreset::ONE_HOUR;
    }
    else if (expiry_choice == 3) {
        preset = ExpiryPreset::ONE_DAY;
    }
    TransferConstraints constraints = constraintsForPreset(preset, currentTimeMillis());

    TcpRendezvous rendezvous(config.transfer.frame_size);
    PeerFanoutManager manager(config.transfer, rendezvous);

    manager.setStateCallback([](SenderState state, const std::string& error) {
        std::cout << "Sharing state: " << senderStateToString(state);
        if (!error.empty()) std::cout << " (" << error << ")";
        std::cout << std::endl;
    });
    manager.setPeerCallback([](const std::string& peer_id, PeerStatus status) {
        std::cout << "Peer " << peer_id << ": " << peerStatusToString(status) << std::endl;
    });
    manager.setStatsCallback([](const SharingStats& stats) {
        if (stats.peers.empty()) return;
        std::cout << "\rProgress: " << static_cast<int>(stats.progress * 100) << "% at "
                  << formatFileSize(stats.total_speed) << "/s" << std::flush;
    });
    manager.setCountdownCallback([](int64_t remaining_seconds) {
        if (remaining_seconds % 60 == 0) {
            std::cout << "\nShare expires in " << remaining_seconds / 60 << " minutes" << std::endl;
        }
    });

    if (!manager.configureFiles(paths, constraints)) {
        std::cerr << "Failed to prepare files" << std::endl;
        waitForEnter();
        return;
    }

    if (!manager.startSharing(port)) {
        std::cerr << "Failed to start sharing: " << manager.getErrorMessage() << std::endl;
        waitForEnter();
        return;
    }

    std::cout << "Sharing on port " << port << ". Press Ctrl+C to stop." << std::endl;

    // Keep main thread alive
    while (g_running) {
        SenderState state = manager.getState();
        if (state == SenderState::ERROR || state == SenderState::IDLE) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    manager.stopSharing();
}

/**
 * Receives files into a directory, reconnecting when the link drops
 */
static void receiveFiles(const EngineConfig& config) {
    std::string address;
    std::string output_dir;

    std::cout << "Enter sharer address (ip:port): ";
    std::cin >> address;

    std::cout << "Enter output directory: ";
    std::cin >> output_dir;

    TransferReceiver receiver(config.transfer, [output_dir](size_t, const FileEntry& entry) -> std::unique_ptr<FileSink> {
        std::unique_ptr<DiskFileSink> sink(new DiskFileSink(output_dir, entry.name));
        if (!sink->isOpen()) return nullptr;
        return std::unique_ptr<FileSink>(std::move(sink));
    });

    receiver.setManifestCallback([](const FileManifest& manifest, bool resumable) {
        std::cout << (resumable ? "Resuming " : "Offered ") << manifest.files.size() << " files, "
                  << formatFileSize(static_cast<double>(manifest.total_size)) << std::endl;
        for (const auto& file : manifest.files) {
            std::cout << "  " << file.name << " (" << formatFileSize(static_cast<double>(file.size)) << ")" << std::endl;
        }
    });
    receiver.setProgressCallback([](size_t file_index, uint64_t received, uint64_t total) {
        int percentage = total > 0 ? static_cast<int>((received * 100) / total) : 100;
        std::cout << "\rFile " << file_index + 1 << ": " << percentage << "% (" << received << "/" << total << " bytes)" << std::flush;
    });
    receiver.setFileCallback([](size_t file_index, FileStatus status) {
        std::cout << "\nFile " << file_index + 1 << " " << fileStatusToString(status) << std::endl;
    });

    TcpRendezvous rendezvous(config.transfer.frame_size);
    if (!receiver.connect(rendezvous, address, "receiver")) {
        std::cerr << "Could not reach " << address << std::endl;
        waitForEnter();
        return;
    }

    bool asked = false;
    while (g_running) {
        ReceiverState state = receiver.getState();

        if (state == ReceiverState::READY_TO_ACCEPT && !asked) {
            asked = true;
            char answer = 'n';
            std::cout << "Accept these files? (y/n): ";
            std::cin >> answer;
            if (answer != 'y' && answer != 'Y') {
                receiver.reset();
                break;
            }
            receiver.accept();
        }
        else if (state == ReceiverState::PAUSED) {
            std::cout << "\nConnection lost, reconnecting..." << std::endl;
            std::this_thread::sleep_for(std::chrono::seconds(2));
            asked = false;
            receiver.connect(rendezvous, address, "receiver");
        }
        else if (state == ReceiverState::COMPLETE) {
            std::cout << "\nAll files received into " << output_dir << std::endl;
            break;
        }
        else if (state == ReceiverState::ERROR) {
            std::cerr << "\nTransfer failed: " << receiver.getErrorMessage() << std::endl;
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    receiver.disconnect();
    waitForEnter();
}

/**
 * Chats until the user types /quit
 */
static void chat(const EngineConfig& config, bool host) {
    std::string address;
    std::string name;

    std::cout << (host ? "Enter port to host on: " : "Enter host address (ip:port): ");
    std::cin >> address;

    std::cout << "Enter your name: ";
    std::cin >> name;
    std::cin.ignore();

    TcpRendezvous rendezvous(config.transfer.frame_size);
    ChatRelay relay(config.chat, rendezvous, name);

    relay.setMessageCallback([](const ChatMessage& message) {
        if (message.is_system) {
            std::cout << "* " << message.content << std::endl;
        } else {
            std::cout << "[" << message.sender_id << "] " << message.content << std::endl;
        }
    });
    relay.setStateCallback([](ChatState state, const std::string& error) {
        if (!error.empty()) {
            std::cerr << "Chat " << chatStateToString(state) << ": " << error << std::endl;
        }
    });

    bool ok = host ? relay.hostRoom(address) : relay.joinRoom(address);
    if (!ok) {
        std::cerr << "Could not enter the room: " << relay.getErrorMessage() << std::endl;
        return;
    }

    std::cout << "Type messages, /who for the member count, /quit to leave." << std::endl;

    std::string line;
    while (g_running && std::getline(std::cin, line)) {
        if (line == "/quit") break;
        if (line == "/who") {
            std::cout << relay.onlineCount() << " online" << std::endl;
            continue;
        }
        if (line.empty()) continue;
        if (!relay.sendText(line)) {
            std::cerr << "Not sent (" << chatStateToString(relay.getState()) << ")" << std::endl;
        }
    }

    relay.leaveRoom();
}

/**
 * Main function
 */
int main(int argc, char* argv[]) {
    // Register signal handler for Ctrl+C
    signal(SIGINT, signalHandler);

    EngineConfig config;
    if (argc > 1) {
        if (!loadConfig(argv[1], config)) {
            std::cerr << "Using default settings" << std::endl;
        }
    }

    std::string error;
    if (!validateConfig(config, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }

    while (g_running) {
        std::cout << "\n=== PeerDrop ===" << std::endl;
        std::cout << "1. Share files" << std::endl;
        std::cout << "2. Receive files" << std::endl;
        std::cout << "3. Host a chat room" << std::endl;
        std::cout << "4. Join a chat room" << std::endl;
        std::cout << "5. Exit" << std::endl;
        std::cout << "Choice: ";

        int choice;
        if (!(std::cin >> choice)) break;

        if (!g_running) break;

        if (choice == 1) {
            shareFiles(config);
        }
        else if (choice == 2) {
            receiveFiles(config);
        }
        else if (choice == 3) {
            chat(config, true);
        }
        else if (choice == 4) {
            chat(config, false);
        }
        else if (choice == 5) {
            break;
        }
    }

    std::cout << "Application terminated." << std::endl;
    return 0;
}

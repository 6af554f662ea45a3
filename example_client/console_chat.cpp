// Core API - everything you always need
#include "chatlink/chatlink.hpp"

// Other standard libraries
#include <format>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace chatlink;

static std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> elems;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        if (!item.empty()) elems.push_back(item);
    }
    return elems;
}

static const char* mark(const DeliveryState& d) {
    switch (d.kind) {
        case DeliveryState::Kind::Sending:   return "..";
        case DeliveryState::Kind::Sent:      return "v";
        case DeliveryState::Kind::Delivered: return "vv";
        case DeliveryState::Kind::Failed:    return "!";
    }
    return "?";
}

static void printHelp() {
    std::cout <<
        "commands:\n"
        "  /login <token> [userId] [name]   store the token and connect\n"
        "  /resume                          connect with the stored token\n"
        "  /join <roomId>                   open a room\n"
        "  /typing <text>                   update the draft without sending\n"
        "  /retry <messageId>               resend a failed message\n"
        "  /list                            show the room's messages\n"
        "  /who                             show typing and online users\n"
        "  /state                           show the connection state\n"
        "  /logout                          disconnect and forget the token\n"
        "  /quit\n"
        "  anything else is sent to the open room\n";
}

int main(int argc, char** argv) {
    ClientOptions opts;
    try {
        if (argc > 1) opts = ClientOptions::fromFile(argv[1]);
    } catch (const ChatError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<ITokenStore> store;
    try {
        store = std::make_shared<FileTokenStore>(opts.tokenStorePath);
    } catch (const ChatError& e) {
        LOG_WARN(std::format("{}; falling back to an in-memory token store", e.what()));
        store = std::make_shared<MemoryTokenStore>();
    }

    ChatClient client(opts, store, WebSocketTransport::factory());

    auto stateSub = client.connection().subscribeState([](const ConnectionState& s) {
        std::cout << "[status] " << s.displayText() << "\n";
    });
    auto eventSub = client.connection().subscribe([](const InboundEvent& ev) {
        if (auto* e = std::get_if<ServerError>(&ev))
            std::cout << "[server] " << e->text << "\n";
        else if (std::holds_alternative<UserRegistered>(ev))
            std::cout << "[server] a new user registered\n";
    });

    std::shared_ptr<RoomSession> room;
    Subscription roomSub;

    std::cout << std::format("chatlink console, server {}\n", opts.url);
    printHelp();

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;

        try {
            if (line[0] != '/') {
                if (!room) { std::cout << "join a room first\n"; continue; }
                room->setDraft(line);
                if (!room->sendDraft()) std::cout << "blank message ignored\n";
                continue;
            }

            auto args = split(line, ' ');
            const std::string& cmd = args[0];

            if (cmd == "/quit") {
                break;
            }
            else if (cmd == "/help") {
                printHelp();
            }
            else if (cmd == "/login" && args.size() >= 2) {
                LocalUser who;
                if (args.size() >= 3) who.id = args[2];
                if (args.size() >= 4) who.name = args[3];
                if (who.empty()) {
                    if (auto claims = inspectBearer(args[1])) who = claims->user();
                }
                if (who.empty()) { std::cout << "user id required for opaque tokens\n"; continue; }
                client.login(args[1], who);
            }
            else if (cmd == "/resume") {
                std::cout << (client.resume() ? "resumed\n" : "nothing to resume\n");
            }
            else if (cmd == "/join" && args.size() >= 2) {
                roomSub.reset();
                room = client.openRoom(args[1]);
                roomSub = room->onMessageChange([](const Message& m) {
                    std::cout << std::format("[{}] {}: {} ({})\n", formatIso8601(m.timestamp),
                                             m.senderName, m.content, mark(m.delivery));
                });
                std::cout << "joined " << args[1] << "\n";
            }
            else if (cmd == "/typing" && room) {
                room->setDraft(line.size() > 8 ? line.substr(8) : "");
            }
            else if (cmd == "/retry" && room && args.size() >= 2) {
                std::cout << (room->retry(args[1]) ? "retrying\n" : "not a failed message\n");
            }
            else if (cmd == "/list" && room) {
                for (const auto& m : room->messages()) {
                    std::cout << std::format("{} {}: {} ({}{})\n", m.id, m.senderName, m.content,
                                             mark(m.delivery),
                                             m.delivery.cause.empty() ? "" : " " + m.delivery.cause);
                }
            }
            else if (cmd == "/who" && room) {
                for (const auto& u : room->typingUsers()) std::cout << u << " is typing\n";
                for (const auto& u : room->onlineUsers()) std::cout << u << " is online\n";
            }
            else if (cmd == "/state") {
                std::cout << client.connection().state().displayText()
                          << std::format(" (reconnect attempts: {})\n", client.connection().reconnectAttempts());
            }
            else if (cmd == "/logout") {
                roomSub.reset();
                room.reset();
                client.logout();
            }
            else {
                printHelp();
            }
        } catch (const ChatError& e) {
            std::cout << std::format("error [{}]: {}\n", errName(e.code()), e.what());
        }
    }

    roomSub.reset();
    room.reset();
    client.connection().disconnect();
    return 0;
}

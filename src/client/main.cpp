#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>

using json = nlohmann::json;

namespace {

constexpr std::chrono::seconds kReplyTimeout{30};
// A stop reply waits for the last chunks to be transcribed.
constexpr std::chrono::minutes kTranscriptTimeout{10};

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--output clipboard|type]   Start recording");
    std::println(stderr, "  stop                              Stop recording and print the transcript");
    std::println(stderr, "  toggle [--output clipboard|type]  Toggle recording");
    std::println(stderr, "  discard                           Drop the current recording");
    std::println(stderr, "  status                            Show daemon status");
    std::println(stderr, "  history [--limit N]               Show transcription history");
    std::println(stderr, "  search --query TEXT [--limit N]   Search transcription history");
    std::println(stderr, "  stats [--days N]                  Summarize the last N days (default 30, 0 = all)");
    std::println(stderr, "  delete SESSION_ID                 Remove a session from history");
    std::println(stderr, "  export [--days N] [--file PATH]   Write history as JSON (default: all, to stdout)");
}

void print_entries(const json& response) {
    if (!response.contains("entries")) return;
    for (const auto& entry : response["entries"]) {
        std::println("[{}] ({}, {:.0f}%) {}", entry.value("timestamp", ""),
                     entry.value("status", ""), entry.value("confidence", 0.0) * 100.0,
                     entry.value("text", ""));
    }
}

void print_stats(const json& r) {
    std::println("Sessions: {} ({} completed, {} incomplete, {} recovered)",
                 r.value("sessions", 0), r.value("completed", 0), r.value("incomplete", 0),
                 r.value("recovered", 0));
    std::println("Audio: {:.1f} min, {} words", r.value("total_duration", 0.0) / 60.0,
                 r.value("total_words", 0));
    if (r.contains("average_confidence") && r["average_confidence"].is_number()) {
        std::println("Average confidence: {:.0f}%", r["average_confidence"].get<double>() * 100.0);
    }
    if (!r.value("most_active_day", "").empty()) {
        std::println("Most active day: {}", r.value("most_active_day", ""));
        std::println("Most recent: {}", r.value("most_recent", ""));
    }
}

bool write_export(const json& entries, const std::string& path) {
    std::string body = entries.dump(2) + "\n";
    if (path.empty()) {
        std::print("{}", body);
        return true;
    }
    std::ofstream out(path, std::ios::trunc);
    out << body;
    if (!out) {
        std::println(stderr, "Cannot write {}", path);
        return false;
    }
    std::println(stderr, "Exported {} entries to {}", entries.size(), path);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string output_method;
    std::string query;
    std::string session_id;
    std::string export_path;
    int limit = 10;
    std::optional<int> days;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_method = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--query" && i + 1 < argc) {
            query = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            days = std::atoi(argv[++i]);
        } else if (arg == "--file" && i + 1 < argc) {
            export_path = argv[++i];
        } else if (command == "delete" && session_id.empty() && !arg.starts_with("-")) {
            session_id = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    json cmd;
    if (command == "start" || command == "toggle") {
        cmd = {{"cmd", command}};
        if (!output_method.empty()) cmd["output"] = output_method;
    } else if (command == "stop" || command == "discard" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "search") {
        if (query.empty()) {
            std::println(stderr, "search needs --query");
            return 1;
        }
        cmd = {{"cmd", "search"}, {"query", query}, {"limit", limit}};
    } else if (command == "stats") {
        cmd = {{"cmd", "stats"}, {"days", days.value_or(30)}};
    } else if (command == "delete") {
        if (session_id.empty()) {
            std::println(stderr, "delete needs a session id");
            return 1;
        }
        cmd = {{"cmd", "delete"}, {"session_id", session_id}};
    } else if (command == "export") {
        cmd = {{"cmd", "export"}, {"days", days.value_or(0)}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (auto conn = client.connect(sock_path); !conn) {
        std::println(stderr, "Cannot reach the daemon: {}", conn.error());
        std::println(stderr, "Is holdscribe running?");
        return 1;
    }

    if (auto sent = client.send(cmd); !sent) {
        std::println(stderr, "Failed to send command: {}", sent.error());
        return 1;
    }

    bool waits_for_transcript = command == "stop" || command == "toggle";
    auto reply = client.recv(waits_for_transcript ? kTranscriptTimeout : kReplyTimeout);
    if (!reply) {
        std::println(stderr, "No response from daemon: {}", reply.error());
        return 1;
    }
    const json& response = *reply;

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("session_id")) {
            std::println("Session: {}", response["session_id"].get<std::string>());
            std::println("Recording duration: {:.1f}s", response.value("duration", 0.0));
            std::println("Chunks: {} ({} transcribing)", response.value("chunks", 0),
                         response.value("pending", 0));
        }
        if (response.contains("notice")) {
            std::println("Last notice: {}", response["notice"].get<std::string>());
        }
    } else if (command == "history" || command == "search") {
        print_entries(response);
    } else if (command == "stats") {
        print_stats(response);
    } else if (command == "export") {
        if (!write_export(response.value("entries", json::array()), export_path)) return 1;
    } else if (command == "delete") {
        std::println("Deleted {} entr{}", response.value("deleted", 0),
                     response.value("deleted", 0) == 1 ? "y" : "ies");
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
        if (response.value("incomplete", false)) {
            std::println(stderr, "(incomplete: some chunks could not be transcribed)");
        }
    } else {
        std::println("{}", response.value("message", "OK"));
    }

    return 0;
}

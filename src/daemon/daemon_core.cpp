#include "daemon_core.hpp"

#include "session/session_recovery.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

json entry_to_json(const HistoryEntry& e) {
    return {
        {"id", e.id},
        {"session_id", e.session_id},
        {"timestamp", e.timestamp},
        {"text", e.text},
        {"audio_duration", e.audio_duration},
        {"confidence", e.confidence},
        {"chunk_count", e.chunk_count},
        {"word_count", e.word_count},
        {"status", e.status},
        {"backend", e.backend},
    };
}

} // namespace

ControllerOptions controller_options(const Config& config) {
    using std::chrono::seconds;
    return ControllerOptions{
        .format = ChunkFormat{
            .chunk_seconds = config.audio.chunk_seconds,
            .sample_rate = config.audio.sample_rate,
            .channels = config.audio.channels,
        },
        .max_duration = seconds(config.session.max_seconds),
        .autosave_interval = seconds(config.session.autosave_seconds),
        .finalize_timeout = seconds(config.session.finalize_timeout_seconds),
        .key_watchdog = seconds(config.session.watchdog_seconds),
        .partial_on_abort = config.session.partial_on_abort,
        .assembler = AssemblerOptions{
            .separator = config.session.separator,
            .timestamps = config.session.timestamps,
        },
    };
}

const char* history_status(const AssembledTranscript& transcript) {
    if (transcript.recovered) return "recovered";
    if (transcript.incomplete) return "incomplete";
    return "completed";
}

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioChunkSource& source, WhisperBackend& backend,
                       Executor& executor, Scheduler& scheduler,
                       CheckpointStore* checkpoints, IpcServer& ipc,
                       OutputFactory output_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      backend_(backend), checkpoints_(checkpoints), ipc_(ipc),
      output_factory_(std::move(output_factory)),
      notify_(std::move(notify)),
      default_output_(parse_output_kind(config_.output.default_method).value_or(OutputKind::Clipboard)),
      next_output_(default_output_),
      controller_(controller_options(config_), source, backend, executor, scheduler,
                  *this, checkpoints,
                  [this](const Notice& n) { on_notice(n); }, verbose) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& history_path) {
    if (!config_.history.enabled) {
        log("History disabled");
        return true;
    }

    history_open_ = history_db_.open(history_path);
    if (!history_open_) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
        return true;
    }

    if (config_.history.retention_days > 0) {
        auto removed = history_db_.remove_older_than(static_cast<int>(config_.history.retention_days));
        if (!removed) {
            std::println(stderr, "db: {}", removed.error());
        } else if (*removed > 0) {
            log(std::format("Pruned {} history entries older than {} days",
                            *removed, config_.history.retention_days));
        }
    }
    return true;
}

size_t DaemonCore::recover() {
    if (!checkpoints_) return 0;

    SessionRecovery recovery(*checkpoints_, backend_, controller_options(config_).assembler, verbose_);
    size_t n = recovery.recover_all(*this);
    if (n > 0) {
        std::println(stderr, "recovery: finished {} interrupted session(s)", n);
    }
    return n;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "discard") return handle_discard(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "search") return handle_search(cmd);
    if (cmd_str == "stats") return handle_stats(cmd);
    if (cmd_str == "delete") return handle_delete(cmd);
    if (cmd_str == "export") return handle_export(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_start(const json& cmd) {
    if (controller_.state() != ControllerState::Idle) {
        return {{"status", "error"}, {"message", "already recording or finalizing"}};
    }

    auto output = default_output_;
    if (cmd.contains("output")) {
        auto requested = cmd["output"].is_string()
            ? parse_output_kind(cmd["output"].get<std::string>()) : std::nullopt;
        if (!requested) {
            return {{"status", "error"}, {"message", "output must be \"clipboard\" or \"type\""}};
        }
        output = *requested;
    }
    {
        std::lock_guard lock(mu_);
        next_output_ = output;
    }

    if (!controller_.engage()) {
        std::lock_guard lock(mu_);
        next_output_ = default_output_;
        return {{"status", "error"}, {"message", "failed to start recording"}};
    }

    auto st = controller_.status();
    return {{"status", "ok"}, {"message", "recording"}, {"session_id", st.session_id}};
}

json DaemonCore::handle_stop(const json& /*cmd*/) {
    auto st = controller_.status();
    if (st.state != ControllerState::Recording) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    if (!controller_.force_stop()) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    log(std::format("Stop requested, {:.1f}s recorded", st.elapsed_s));
    return {{"status", "finalizing"}, {"session_id", st.session_id}, {"duration", st.elapsed_s}};
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (controller_.state() == ControllerState::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_discard(const json& /*cmd*/) {
    auto st = controller_.status();
    if (st.state == ControllerState::Idle || !controller_.discard()) {
        return {{"status", "error"}, {"message", "nothing to discard"}};
    }

    complete(st.session_id, {{"status", "error"}, {"message", "session discarded"}});
    return {{"status", "ok"}, {"message", "discarded"}, {"session_id", st.session_id}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    auto st = controller_.status();
    json resp = {{"status", "ok"}, {"state", to_string(st.state)}};

    if (st.state != ControllerState::Idle) {
        resp["session_id"] = st.session_id;
        resp["duration"] = st.elapsed_s;
        resp["chunks"] = st.chunks;
        resp["pending"] = st.pending;
        if (st.last_autosave_at) {
            resp["last_autosave"] = std::chrono::duration_cast<std::chrono::seconds>(
                st.last_autosave_at->time_since_epoch()).count();
        }
    }

    std::lock_guard lock(mu_);
    if (last_notice_) {
        resp["notice"] = last_notice_->message;
    }
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = cmd.value("limit", 10);
    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (const auto& e : history_db_.recent(limit)) {
        resp["entries"].push_back(entry_to_json(e));
    }
    return resp;
}

json DaemonCore::handle_search(const json& cmd) {
    auto query = cmd.value("query", "");
    if (query.empty()) {
        return {{"status", "error"}, {"message", "missing query"}};
    }

    int limit = cmd.value("limit", 10);
    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (const auto& e : history_db_.search(query, limit)) {
        resp["entries"].push_back(entry_to_json(e));
    }
    return resp;
}

json DaemonCore::handle_stats(const json& cmd) {
    int days = cmd.value("days", 30);
    auto st = history_db_.stats(days);
    if (!st) return {{"status", "error"}, {"message", st.error()}};

    return {
        {"status", "ok"},
        {"days", days},
        {"sessions", st->sessions},
        {"completed", st->completed},
        {"incomplete", st->incomplete},
        {"recovered", st->recovered},
        {"total_duration", st->total_duration},
        {"total_words", st->total_words},
        {"average_confidence",
         st->average_confidence ? json(*st->average_confidence) : json(nullptr)},
        {"most_recent", st->most_recent},
        {"most_active_day", st->most_active_day},
    };
}

json DaemonCore::handle_delete(const json& cmd) {
    auto session_id = cmd.value("session_id", "");
    if (session_id.empty()) {
        return {{"status", "error"}, {"message", "missing session_id"}};
    }
    auto removed = history_db_.remove_session(session_id);
    if (!removed) return {{"status", "error"}, {"message", removed.error()}};
    if (*removed == 0) {
        return {{"status", "error"}, {"message", "no history entry for " + session_id}};
    }
    log(std::format("Deleted {} history entr{} of session {}", *removed,
                    *removed == 1 ? "y" : "ies", session_id));
    return {{"status", "ok"}, {"deleted", *removed}};
}

json DaemonCore::handle_export(const json& cmd) {
    auto entries = history_db_.entries_since(cmd.value("days", 0));
    if (!entries) return {{"status", "error"}, {"message", entries.error()}};

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (const auto& e : *entries) {
        resp["entries"].push_back(entry_to_json(e));
    }
    return resp;
}

void DaemonCore::deliver(const AssembledTranscript& t) {
    OutputKind kind;
    {
        std::lock_guard lock(mu_);
        kind = next_output_;
        next_output_ = default_output_;
    }

    log(std::format("Delivering {} chars ({}, confidence {:.2f})",
                    t.full_text.size(), history_status(t), t.confidence));

    if (!t.full_text.empty()) {
        auto output = output_factory_(kind);
        if (output) {
            auto res = output->deliver(t.full_text);
            if (!res) {
                std::println(stderr, "output: {} failed: {}", output_kind_name(kind), res.error());
            }
        }
    }

    if (history_open_ && t.chunk_count > 0) {
        history_db_.insert(HistoryEntry{
            .session_id = t.session_id,
            .text = t.full_text,
            .audio_duration = t.duration_s,
            .confidence = t.confidence,
            .chunk_count = static_cast<int64_t>(t.chunk_count),
            .word_count = static_cast<int64_t>(count_words(t.full_text)),
            .status = history_status(t),
            .backend = backend_.name(),
        });
    }

    json response = {
        {"status", "ok"},
        {"session_id", t.session_id},
        {"text", t.full_text},
        {"confidence", t.confidence},
        {"duration", t.duration_s},
        {"chunks", t.chunk_count},
        {"incomplete", t.incomplete},
    };
    if (!t.timestamps.empty()) {
        json ts = json::array();
        for (const auto& f : t.timestamps) {
            ts.push_back({{"sequence", f.sequence}, {"offset", f.offset_s}, {"duration", f.duration_s}});
        }
        response["timestamps"] = std::move(ts);
    }
    complete(t.session_id, std::move(response));
}

void DaemonCore::on_notice(const Notice& notice) {
    std::println(stderr, "notice: {}", notice.message);
    {
        std::lock_guard lock(mu_);
        last_notice_ = notice;
    }
    if (notice.kind == Notice::Kind::Aborted) {
        complete(notice.session_id, {{"status", "error"}, {"message", notice.message}});
    }
}

void DaemonCore::complete(const std::string& session_id, json response) {
    {
        std::lock_guard lock(mu_);
        completed_.emplace_back(session_id, std::move(response));
    }
    if (notify_) notify_();
}

void DaemonCore::on_results_ready() {
    std::vector<std::pair<std::string, json>> done;
    {
        std::lock_guard lock(mu_);
        done.swap(completed_);
    }

    for (const auto& [session_id, response] : done) {
        std::erase_if(waiting_clients_, [&](const WaitingClient& c) {
            if (c.session_id != session_id) return false;
            ipc_.send_response(c.fd, response);
            return true;
        });
    }
}

void DaemonCore::add_waiting_client(int fd, const std::string& session_id) {
    waiting_clients_.push_back({fd, session_id});
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase_if(waiting_clients_, [fd](const WaitingClient& c) { return c.fd == fd; });
}

void DaemonCore::shutdown() {
    if (controller_.state() != ControllerState::Idle) {
        log("Finishing the current session before exit...");
    }
    controller_.shutdown();
    on_results_ready();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdscribe] {}", msg);
    }
}

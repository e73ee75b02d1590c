#include "tracer_cli.hpp"
#include "theme.hpp"
#include <capture/boundary_detector.hpp>
#include <capture/session_registry.hpp>
#include <capture/session_store.hpp>
#include <capture/terminal_proxy.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/pty_host.hpp>
#include <platform/terminal.hpp>
#include <privacy/redaction_engine.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace {

// --flag VALUE / --flag=VALUE / bare switches / positionals.
struct ParsedArgs {
    std::map<std::string, std::string> values;
    std::set<std::string> switches;
    std::vector<std::string> positional;
    std::string error;

    bool has(const std::string& key) const { return switches.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = values.find(key);
        return it == values.end() ? fallback : it->second;
    }
};

ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& value_flags,
                      const std::set<std::string>& switch_flags) {
    ParsedArgs out;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a.rfind("--", 0) != 0 || a == "--") {
            out.positional.push_back(a);
            continue;
        }
        std::string key = a;
        std::string value;
        bool inline_value = false;
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            key = a.substr(0, eq);
            value = a.substr(eq + 1);
            inline_value = true;
        }

        if (switch_flags.count(key)) {
            out.switches.insert(key);
        } else if (value_flags.count(key)) {
            if (!inline_value) {
                if (i + 1 >= args.size()) {
                    out.error = "Missing value for " + key;
                    return out;
                }
                value = args[++i];
            }
            out.values[key] = value;
        } else {
            out.error = "Unknown option: " + key;
            return out;
        }
    }
    return out;
}

bool apply_mode_flag(const ParsedArgs& pa, TracerSettings& s) {
    if (!pa.values.count("--mode")) return true;
    auto mode = parse_privacy_mode(pa.get("--mode"));
    if (!mode) {
        std::cout << theme::fail("Unknown mode '" + pa.get("--mode") + "' (minimal, moderate, strict)");
        return false;
    }
    s.privacy_mode = *mode;
    return true;
}

std::string status_label(SessionStatus status) {
    std::string name = session_status_name(status);
    switch (status) {
        case SessionStatus::kActive:    return theme::teal(name);
        case SessionStatus::kCompleted: return theme::green(name);
        case SessionStatus::kTimeout:   return theme::yellow(name);
        case SessionStatus::kError:     return theme::red(name);
    }
    return name;
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) std::cout << theme::warn(w);
}

// Text blocks indented under a heading.
void print_block(const std::string& label, const std::string& text) {
    std::cout << "    " << theme::bold(label) << "\n";
    std::istringstream in(text.empty() ? std::string("(empty)") : text);
    std::string line;
    while (std::getline(in, line)) std::cout << "      " << line << "\n";
}

} // namespace

Result<Config> TracerCLI::load_config() {
    auto config = Config::load();
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return config;
    }
    print_warnings(config.value.warnings());
    return config;
}

// ── run ────────────────────────────────────────────────────────

int TracerCLI::run_capture(const std::vector<std::string>& args) {
    auto pa = parse_args(args, {"--command", "--mode", "--dir"}, {"--debug"});
    if (!pa.error.empty()) {
        std::cout << theme::fail(pa.error);
        return 1;
    }

    auto config = load_config();
    if (config.is_err()) return 1;
    TracerSettings settings = config.value.settings();

    settings.command = pa.get("--command", settings.command);
    settings.sessions_dir = pa.get("--dir", settings.sessions_dir);
    if (pa.has("--debug")) settings.debug = true;
    if (!apply_mode_flag(pa, settings)) return 1;
    if (trimmed(settings.command).empty()) {
        std::cout << theme::fail("No command to run");
        return 1;
    }

    if (settings.debug) {
        fs::path log_file = fs::path(settings.sessions_dir) / ("debug-" + now_stamp() + ".log");
        log_configure(log_file.string(), LogLevel::kDebug);
    } else {
        log_configure("", parse_log_level(settings.log_level));
    }

    RedactionEngine engine(settings.privacy_mode);
    print_warnings(configure_engine(engine, settings));

    PromptMarkerDetector detector(settings.prompt_marker);
    SessionFileSink sink(settings.sessions_dir);
    SessionRegistry registry;
    platform::PosixTerminalHost host;

    ProxyOptions options;
    options.session_timeout_secs = settings.session_timeout;
    options.teardown_grace_ms = settings.teardown_grace_ms;
    options.debug = settings.debug;
    options.registry = &registry;
    options.on_session_start = [&](const Session& s) {
        std::cout << theme::banner();
        std::cout << theme::kv("session", s.id);
        std::cout << theme::kv("command", s.command);
        std::cout << theme::kv("privacy", privacy_mode_name(s.privacy_mode));
        std::cout << theme::kv("artifact", sink.path_for(s.id).string());
        if (s.debug) std::cout << theme::kv("debug log", log_path());
        std::cout << "\n" << std::flush;
    };

    TerminalProxy proxy(host, engine, detector, sink, options);

    platform::watch_interrupts();
    auto result = proxy.start(settings.command);
    platform::unwatch_interrupts();
    platform::clear_interrupt();

    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("Could not start '{}': {}", settings.command, result.error));
        return 1;
    }

    const Session& s = result.value;
    std::cout << "\n" << theme::section("Session ended");
    std::cout << theme::kv("session", s.id);
    std::cout << theme::kv("status", status_label(s.status));
    std::cout << theme::kv("turns", std::to_string(s.interactions.size()));
    std::cout << theme::kv("duration", format_duration(s.start_time, s.end_time));
    if (s.exit_code) std::cout << theme::kv("exit code", std::to_string(*s.exit_code));
    std::cout << theme::kv("artifact", sink.path_for(s.id).string());
    std::cout << "\n";
    return s.status == SessionStatus::kError ? 1 : 0;
}

// ── list / view ────────────────────────────────────────────────

int TracerCLI::run_list(const std::vector<std::string>& args) {
    auto pa = parse_args(args, {"--dir"}, {});
    if (!pa.error.empty()) {
        std::cout << theme::fail(pa.error);
        return 1;
    }
    auto config = load_config();
    if (config.is_err()) return 1;
    fs::path dir = pa.get("--dir", config.value.settings().sessions_dir);

    auto files = list_session_files(dir);
    if (files.empty()) {
        std::cout << theme::info("No sessions in " + dir.string());
        return 0;
    }

    std::cout << theme::section(fmt::format("Sessions in {}", dir.string()));
    int shown = 0;
    for (const auto& f : files) {
        if (shown++ >= SESSION_LIST_LIMIT) break;
        auto loaded = load_session(f);
        if (loaded.is_err()) {
            std::cout << theme::fail(fmt::format("{:<24} unreadable ({})", f.filename().string(), loaded.error));
            continue;
        }
        const Session& s = loaded.value;
        std::cout << fmt::format("    {:<24} {:<20} {:>8} {:>4} turns  ",
                                 s.id, format_timestamp(s.start_time),
                                 format_duration(s.start_time, s.end_time),
                                 s.interactions.size())
                  << status_label(s.status) << "\n";
    }
    if (files.size() > static_cast<size_t>(SESSION_LIST_LIMIT)) {
        std::cout << "\n" << theme::dim(fmt::format("    ... {} older sessions not shown",
                                                   files.size() - SESSION_LIST_LIMIT)) << "\n";
    }
    std::cout << "\n";
    return 0;
}

int TracerCLI::run_view(const std::vector<std::string>& args) {
    auto pa = parse_args(args, {"--dir"}, {"--raw"});
    if (!pa.error.empty()) {
        std::cout << theme::fail(pa.error);
        return 1;
    }
    if (pa.positional.empty()) {
        std::cout << theme::fail("Missing session id.");
        std::cout << theme::step("Usage: cctrace view <session> [--dir PATH] [--raw]");
        return 1;
    }
    auto config = load_config();
    if (config.is_err()) return 1;
    fs::path dir = pa.get("--dir", config.value.settings().sessions_dir);

    fs::path file = resolve_session_file(dir, pa.positional[0]);
    auto loaded = load_session(file);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }
    const Session& s = loaded.value;
    bool raw = pa.has("--raw");

    std::cout << theme::section("Session " + s.id);
    std::cout << theme::kv("command", s.command.empty() ? "-" : s.command);
    std::cout << theme::kv("project", s.project_path.empty() ? "-" : s.project_path);
    std::cout << theme::kv("started", format_timestamp(s.start_time));
    std::cout << theme::kv("ended", format_timestamp(s.end_time));
    std::cout << theme::kv("duration", format_duration(s.start_time, s.end_time));
    std::cout << theme::kv("status", status_label(s.status));
    std::cout << theme::kv("privacy", privacy_mode_name(s.privacy_mode));
    std::cout << theme::kv("turns", std::to_string(s.interactions.size()));
    if (raw) std::cout << theme::warn("Showing unmasked text");

    for (const auto& it : s.interactions) {
        std::cout << "\n" << theme::rule();
        std::cout << "    " << theme::amber(it.id()) << "  "
                  << theme::dim(format_timestamp(it.timestamp)) << "\n\n";
        print_block("user", raw ? it.raw_user : it.masked_user);
        std::cout << "\n";
        print_block("assistant", raw ? it.raw_assistant : it.masked_assistant);
        if (!it.detected_patterns.empty()) {
            std::string names;
            for (const auto& n : it.detected_patterns) names += (names.empty() ? "" : ", ") + n;
            std::cout << "\n" << theme::dim("    masked: " + names) << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

// ── patterns / redact ──────────────────────────────────────────

int TracerCLI::run_patterns(const std::vector<std::string>& args) {
    auto pa = parse_args(args, {"--mode"}, {});
    if (!pa.error.empty()) {
        std::cout << theme::fail(pa.error);
        return 1;
    }
    auto config = load_config();
    if (config.is_err()) return 1;
    TracerSettings settings = config.value.settings();
    if (!apply_mode_flag(pa, settings)) return 1;

    RedactionEngine engine(settings.privacy_mode);
    print_warnings(configure_engine(engine, settings));

    std::cout << theme::section(fmt::format("Patterns ({} mode)", privacy_mode_name(engine.mode())));
    for (const auto& p : engine.summary()) {
        std::string state = !p.enabled ? theme::red("off")
                          : p.scanned  ? theme::green("on ")
                                       : theme::dim("-- ");
        std::cout << "    " << state << " "
                  << fmt::format("{:<18} {:<8} ", p.name, sensitivity_name(p.level))
                  << theme::dim(p.description) << "\n";
    }
    std::cout << "\n";
    return 0;
}

int TracerCLI::run_redact(const std::vector<std::string>& args) {
    auto pa = parse_args(args, {"--mode"}, {});
    if (!pa.error.empty()) {
        std::cerr << theme::fail(pa.error);
        return 1;
    }
    auto config = Config::load();
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }
    TracerSettings settings = config.value.settings();
    if (pa.values.count("--mode")) {
        auto mode = parse_privacy_mode(pa.get("--mode"));
        if (!mode) {
            std::cerr << theme::fail("Unknown mode '" + pa.get("--mode") + "'");
            return 1;
        }
        settings.privacy_mode = *mode;
    }

    std::string text;
    if (pa.positional.empty() || pa.positional[0] == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        text = ss.str();
    } else {
        std::ifstream in(pa.positional[0], std::ios::binary);
        if (!in) {
            std::cerr << theme::fail("Cannot read " + pa.positional[0]);
            return 1;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        text = ss.str();
    }

    RedactionEngine engine(settings.privacy_mode);
    for (const auto& w : configure_engine(engine, settings)) std::cerr << theme::warn(w);

    MaskResult masked = engine.mask(text);
    std::cout << masked.text << std::flush;

    SensitivityReport report = engine.analyze(text);
    if (!report.level) {
        std::cerr << theme::ok("No sensitive content detected");
        return 0;
    }
    std::cerr << theme::kv("level", sensitivity_name(*report.level));
    std::cerr << theme::kv("score", std::to_string(report.score));
    std::cerr << theme::kv("approval", report.requires_approval ? "required" : "not required");
    std::string names;
    for (const auto& n : report.detected) names += (names.empty() ? "" : ", ") + n;
    std::cerr << theme::kv("detected", names);
    std::cerr << theme::kv("masked", std::to_string(masked.matches.size()) + " spans");
    return 0;
}

// ── init ───────────────────────────────────────────────────────

int TracerCLI::run_init() {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
        return 0;
    }
    auto r = create_default_global_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    std::cout << theme::step("Per-project overrides go in ./cctrace.yaml");
    return 0;
}

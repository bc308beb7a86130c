// Reqline main: verb + clause HTTP client
#include <reqline/config/config.hpp>
#include <reqline/exec/executor.hpp>
#include <reqline/net/curl_global.hpp>
#include <reqline/net/curl_transport.hpp>
#include <reqline/parse/grammar.hpp>
#include <reqline/parse/parser.hpp>
#include <reqline/plan/plan_json.hpp>
#include <reqline/plan/planner.hpp>
#include <reqline/session/session_store.hpp>

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <unistd.h>

using namespace reqline;

static Config g_cfg;
static bool g_stderr_tty = false;

static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color || !g_stderr_tty) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void print_error(const std::string& msg, const std::string& suggestion = {}) {
    std::cerr << apply_color("Error:", "1;31") << " " << msg << "\n";
    if (!suggestion.empty()) std::cerr << apply_color("Hint:", "33") << " Try using '" << suggestion << "' instead\n";
}

static void print_usage() {
    std::cerr << "Usage: reqline <verb> <target> [clauses...]\n\n"
              << "Verbs: read, save, send, upload, watch, inspect, authenticate, session\n\n"
              << "Examples:\n"
              << "  reqline read https://api.example.com/users as=json\n"
              << "  reqline send https://api.example.com/users with='{\"name\":\"Ada\"}'\n"
              << "  reqline send https://api.example.com/users using=PUT with='{\"name\":\"Ada\"}'\n"
              << "  reqline save https://example.com/file.zip to=file.zip\n\n"
              << "Commands: help, grammar, explain \"<command>\"\n"
              << "Flags: --help, --version, --dry-run\n";
}

static std::string join(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) { if (!out.empty()) out += ' '; out += args[i]; }
    return out;
}

static int session_command(const Command& cmd, const SessionStore& store) {
    std::string host = extract_host(cmd.target);
    switch (cmd.session_subcommand) {
        case SessionSubcommand::Show: {
            auto s = store.load(host);
            if (!s) { std::cout << "No session found for " << host << "\n"; return 0; }
            bool as_json = false;
            for (auto &c : cmd.clauses) if (auto a = std::get_if<AsClause>(&c); a && a->format == "json") as_json = true;
            if (as_json) { std::cout << session_to_json(*s).dump(2) << "\n"; return 0; }
            Session r = redact(*s);
            std::cout << "Session for " << r.host << ":\n";
            if (!r.cookies.empty()) {
                std::cout << "Cookies:\n";
                for (auto &kv : r.cookies) std::cout << "  " << kv.first << ": " << kv.second << "\n";
            }
            if (!r.authorization.empty()) std::cout << "Authorization: " << r.authorization << "\n";
            return 0;
        }
        case SessionSubcommand::Clear:
            store.remove(host);
            std::cout << "Session cleared for " << host << "\n";
            return 0;
        case SessionSubcommand::Use:
            if (!store.load(host)) { print_error("no session found for " + host); return 5; }
            std::cout << "export REQLINE_SESSION_HOST=" << host << "\n";
            return 0;
        case SessionSubcommand::None:
            break;
    }
    print_error("session needs a subcommand: show, clear or use");
    return 5;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> warnings;
    g_cfg = load_config(&warnings);
    g_stderr_tty = isatty(STDERR_FILENO);
    bool stdout_tty = isatty(STDOUT_FILENO);
    for (auto &w : warnings) std::cerr << apply_color("Warning:", "33") << " " << w << "\n";

    // URL parsing in the grammar already goes through libcurl
    std::unique_ptr<net::CurlGlobal> curl;
    try {
        curl = std::make_unique<net::CurlGlobal>();
    } catch (const std::runtime_error& e) {
        print_error(e.what());
        return 4;
    }

    bool dry_run = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-help" || a == "-h") { print_usage(); return 0; }
        if (a == "--version" || a == "-version" || a == "-v") { std::cout << "reqline version " << REQLINE_VERSION << "\n"; return 0; }
        if (a == "--dry-run" || a == "-dry-run") { dry_run = true; continue; }
        args.push_back(a);
    }
    if (args.empty()) { print_usage(); return 5; }

    if (args[0] == "help") { std::cout << format_help(); return 0; }
    if (args[0] == "grammar") { std::cout << grammar_snapshot_json() << "\n"; return 0; }
    if (args[0] == "explain") {
        if (args.size() < 2) { std::cerr << "Usage: reqline explain \"<command>\"\n"; return 5; }
        dry_run = true;
        args.erase(args.begin());
    }

    Command cmd;
    ExecutionPlan plan;
    try {
        cmd = parse_command(join(args, 0));
        if (cmd.verb == Verb::Session) {
            SessionStore store(g_cfg.session_dir);
            return session_command(cmd, store);
        }
        plan = Planner().plan(cmd);
    } catch (const ParseError& e) {
        print_error(e.what(), e.suggestion());
        return 5;
    } catch (const PlanError& e) {
        print_error(e.what());
        return 5;
    } catch (const SessionError& e) {
        print_error(e.what());
        return 5;
    }

    if (dry_run) {
        std::cout << to_json(plan, stdout_tty) << "\n";
        return 0;
    }

    try {
        net::CurlTransport transport;
        SessionStore sessions(g_cfg.session_dir);
        ExecContext ctx;
        ctx.stdout_is_tty = stdout_tty;
        ctx.default_timeout = g_cfg.timeout;
        ctx.connect_timeout = g_cfg.connect_timeout;
        ctx.user_agent = g_cfg.user_agent;
        Executor(transport, &sessions, ctx).execute(plan);
    } catch (const ExecutionError& e) {
        print_error(e.what());
        return e.exit_code();
    } catch (const std::exception& e) {
        print_error(e.what());
        return 4;
    }
    return 0;
}

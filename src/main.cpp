// winpipe main: option parsing, bus setup and error reporting
#include <winpipe/cli/args.hpp>
#include <winpipe/compile/commands.hpp>
#include <winpipe/ipc/dbus_connection.hpp>
#include <winpipe/ipc/script_host.hpp>
#include <winpipe/session/config.hpp>
#include <winpipe/session/context.hpp>
#include <winpipe/session/session.hpp>
#include <winpipe/util/error.hpp>
#include <winpipe/util/log.hpp>

#include <iostream>
#include <optional>
#include <string>

#ifndef WINPIPE_VERSION
#define WINPIPE_VERSION "0.0.0"
#endif

namespace {

struct Options {
    bool help = false;
    bool version = false;
    bool debug = false;
    bool dry_run = false;
    std::optional<std::string> remove;
    std::string shortcut;
    std::string script_name;
    std::optional<std::string> first_command;
};

void print_usage() {
    std::cout << "Usage: winpipe [options] <command> [args...] [<command> [args...]]...\n\n"
                 "Options:\n"
                 "  -h, --help                 Show this help\n"
                 "  -v, --version              Show program version\n"
                 "  -d, --debug                Enable debug output\n"
                 "  -n, --dry-run              Print the generated script instead of running it\n"
                 "  --shortcut <shortcut>      Register a shortcut that runs the commands\n"
                 "    --name <name>            Name the shortcut script so it can be removed later\n"
                 "  --remove <name>            Remove a previously registered shortcut script\n\n"
                 "Commands:\n"
                 "  search [--class] [--classname] [--role] [--name] [--pid N] [--desktop N]\n"
                 "         [--screen N] [--limit N] [--all|--any] <term>\n"
                 "  getactivewindow\n"
                 "  savewindowstack <name>\n"
                 "  loadwindowstack <name>\n";
    for (auto& name : winpipe::compile::window_action_names()) std::cout << "  " << name << " [<window>]\n";
    for (auto& name : winpipe::compile::global_action_names()) std::cout << "  " << name << "\n";
    std::cout << "\nWindow can be specified as:\n"
                 "  %1          the first window in the stack (default)\n"
                 "  %N          the Nth window in the stack\n"
                 "  %@          all windows in the stack\n"
                 "  <window id> the window with the given ID\n";
}

Options parse_options(winpipe::ArgCursor& args) {
    Options o;
    while (auto arg = args.next()) {
        if (arg->is_short('h') || arg->is_long("help")) o.help = true;
        else if (arg->is_short('v') || arg->is_long("version")) o.version = true;
        else if (arg->is_short('d') || arg->is_long("debug")) o.debug = true;
        else if (arg->is_short('n') || arg->is_long("dry-run")) o.dry_run = true;
        else if (arg->is_long("shortcut")) o.shortcut = args.value();
        else if (arg->is_long("name")) o.script_name = args.value();
        else if (arg->is_long("remove")) o.remove = args.value();
        else if (arg->kind == winpipe::ArgKind::Value) { o.first_command = arg->text; break; }
        else winpipe::throw_unexpected(*arg);
    }
    return o;
}

std::string join_cmdline(int argc, char* argv[]) {
    std::string out;
    for (int i = 0; i < argc; ++i) {
        if (i) out += ' ';
        out += argv[i];
    }
    return out;
}

int run(int argc, char* argv[]) {
    using namespace winpipe;
    ArgCursor args = ArgCursor::from_argv(argc, argv);
    Options opts = parse_options(args);

    if (opts.version) {
        std::cout << "winpipe v" << WINPIPE_VERSION << "\n";
        return 0;
    }
    if (opts.help || (!opts.first_command && !opts.remove)) {
        print_usage();
        return 0;
    }

    init_logging(opts.debug);
    session::Config cfg = session::load_config(session::default_config_path());
    bool debug = opts.debug || cfg.debug;
    if (debug != opts.debug) init_logging(debug);

    auto control = ipc::BusConnection::open_session_bus(cfg.reply_timeout_ms);
    session::SessionContext ctx;
    ctx.debug = debug;
    ctx.kde5 = session::detect_kde5(cfg.host_version);
    ctx.script_name = opts.script_name;
    ctx.shortcut = opts.shortcut;
    ctx.cmdline = join_cmdline(argc, argv);
    ipc::KWinScriptHost host(*control, ctx.kde5);

    session::SessionOptions sopts;
    sopts.dry_run = opts.dry_run;
    sopts.keep_script = cfg.keep_script;
    sopts.completion_timeout_ms = cfg.completion_timeout_ms;

    if (opts.remove) {
        session::Session s(host, *control, sopts, std::cout, std::cerr);
        s.remove(*opts.remove);
        return 0;
    }

    auto callbacks = ipc::BusConnection::open_session_bus(cfg.reply_timeout_ms);
    session::Session s(host, *callbacks, sopts, std::cout, std::cerr);
    s.execute(ctx, args, *opts.first_command);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}

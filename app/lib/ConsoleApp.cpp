#include "ConsoleApp.hpp"

#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <termios.h>
#include <unistd.h>

#include "ErrorMessages.hpp"

namespace fs = std::filesystem;

namespace {

std::string size_column(const std::optional<SizeState>& state)
{
    if (!state) {
        return "-";
    }
    switch (state->status) {
        case SizeState::Status::Computed:
            return Utils::format_file_size(state->bytes);
        case SizeState::Status::Unavailable:
            return "?";
        default:
            return "-";
    }
}

std::string kind_suffix(FileKind kind)
{
    switch (kind) {
        case FileKind::Directory: return "/";
        case FileKind::Symlink: return "@";
        case FileKind::Other: return "*";
        default: return "";
    }
}

}


ConsoleApp::ConsoleApp(Settings& settings,
                       fs::path start_dir,
                       std::istream& in,
                       std::ostream& out,
                       PasswordReader password_reader,
                       std::unique_ptr<IElevationBackend> elevation_backend)
    : settings(settings),
      in(in),
      out(out),
      password_reader(password_reader ? std::move(password_reader) : PasswordReader(read_password_from_terminal)),
      ui_logger(Logger::get_logger("ui_logger")),
      cwd(Utils::absolutize(start_dir.empty() ? fs::current_path() : start_dir)),
      sizes(Logger::get_logger("core_logger")),
      trash(Utils::utf8_to_path(settings.get_trash_dir()), {}, Logger::get_logger("core_logger")),
      engine(trash, sizes, settings.get_paste_collision_policy(), Logger::get_logger("core_logger")),
      backend(elevation_backend ? std::move(elevation_backend)
                                : std::make_unique<SudoElevationBackend>(settings.get_sudo_path(),
                                                                         Logger::get_logger("security_logger"))),
      escalation(engine, *backend, Logger::get_logger("security_logger")),
      undo_stack(engine, settings.get_undo_limit(), Logger::get_logger("core_logger")),
      worker(settings.get_worker_queue_capacity(), Logger::get_logger("core_logger")),
      session(engine, undo_stack, escalation, worker, settings.get_escalation_scope(), Logger::get_logger("ui_logger"))
{
    if (ui_logger) {
        ui_logger->info("Session started in '{}' (trash: '{}')", Utils::path_to_utf8(cwd),
                        Utils::path_to_utf8(trash.root()));
    }
}


ConsoleApp::~ConsoleApp()
{
    worker.cancel_current();
}


const fs::path& ConsoleApp::current_directory() const
{
    return cwd;
}


int ConsoleApp::run()
{
    out << "termfiles: type 'help' for commands" << std::endl;
    std::string line;
    for (;;) {
        drain_events();
        handle_pending_escalation();

        out << "termfiles:" << Utils::abbreviate_user_path(Utils::path_to_utf8(cwd))
            << (worker.busy() ? " [busy]" : "") << "> " << std::flush;
        if (!std::getline(in, line)) {
            out << std::endl;
            break;
        }
        if (!execute_line(line)) {
            break;
        }
    }

    wait_for_idle();
    if (ui_logger) {
        ui_logger->info("Session ended with {} undo entr{} discarded", undo_stack.depth(),
                        undo_stack.depth() == 1 ? "y" : "ies");
    }
    return EXIT_SUCCESS;
}


void ConsoleApp::wait_for_idle()
{
    // A pending escalation can itself queue more work, so settle both.
    for (;;) {
        worker.wait_idle();
        drain_events();
        if (!session.escalation_pending()) {
            break;
        }
        handle_pending_escalation();
    }
}


bool ConsoleApp::execute_line(const std::string& line)
{
    const Args args = tokenize(line);
    if (args.empty()) {
        return true;
    }
    const std::string& name = args.front();

    try {
        if (name == "quit" || name == "exit" || name == "q") {
            return false;
        } else if (name == "help" || name == "?") {
            print_help();
        } else if (name == "ls") {
            cmd_ls(args);
        } else if (name == "cd") {
            cmd_cd(args);
        } else if (name == "pwd") {
            out << Utils::path_to_utf8(cwd) << "\n";
        } else if (name == "size") {
            cmd_size(args);
        } else if (name == "cp") {
            cmd_copy_or_move(args, false);
        } else if (name == "mv") {
            cmd_copy_or_move(args, true);
        } else if (name == "rm") {
            cmd_rm(args);
        } else if (name == "rename") {
            cmd_rename(args);
        } else if (name == "touch") {
            cmd_create(args, CreationKind::File);
        } else if (name == "mkdir") {
            cmd_create(args, CreationKind::Directory);
        } else if (name == "undo") {
            cmd_undo();
        } else if (name == "trash") {
            cmd_trash();
        } else if (name == "cancel") {
            cmd_cancel();
        } else if (name == "wait") {
            wait_for_idle();
        } else {
            out << "Unknown command '" << name << "'. Type 'help'.\n";
        }
    } catch (const ErrorCodes::AppException& ex) {
        out << ex.get_user_message() << "\n";
        if (ui_logger) {
            ui_logger->info("Rejected '{}': {}", line, ex.get_full_details());
        }
    } catch (const fs::filesystem_error& ex) {
        out << ex.what() << "\n";
        if (ui_logger) {
            ui_logger->warn("'{}' failed: {}", line, ex.what());
        }
    }
    out << std::flush;
    return true;
}


void ConsoleApp::drain_events()
{
    for (const auto& event : session.poll()) {
        print_event(event);
    }
    out << std::flush;
}


void ConsoleApp::handle_pending_escalation()
{
    while (session.escalation_pending()) {
        const std::vector<Command> waiting = session.commands_awaiting_escalation();
        std::string what = waiting.size() == 1 ? describe(waiting.front())
                                               : fmt::format("{} operations", waiting.size());
        std::optional<std::string> credential = password_reader(
            fmt::format(fmt::runtime(MSG_NEEDS_ESCALATION), what));

        if (!credential || credential->empty()) {
            session.decline_escalation();
        } else {
            const std::optional<AuthError> error = session.provide_credential(*credential);
            if (error && ui_logger) {
                ui_logger->warn("Escalation for '{}' failed: {}", what, to_string(error.value()));
            }
            if (error == AuthError::SessionInUse) {
                drain_events();
                break;
            }
        }
        if (credential) {
            Utils::wipe_string(*credential);
        }
        drain_events();
    }
}


void ConsoleApp::print_event(const SessionEvent& event)
{
    if (event.job_id != 0) {
        out << "[#" << event.job_id << "] ";
    }
    out << event.message << "\n";
    for (const auto& failure : event.failures) {
        out << "    " << Utils::path_to_utf8(failure.path) << ": " << failure.detail << "\n";
    }
    for (const auto& path : event.partial_output) {
        out << "    left in place: " << Utils::path_to_utf8(path) << "\n";
    }
}


void ConsoleApp::print_help()
{
    out << "Commands:\n"
        << "  ls [-a] [DIR]            list a directory (sizes shown once computed)\n"
        << "  cd DIR | pwd             change or show the current directory\n"
        << "  size PATH...             compute sizes (directories: immediate files only)\n"
        << "  cp SRC... DEST           copy into directory DEST\n"
        << "  mv SRC... DEST           move into directory DEST\n"
        << "  rm PATH...               move to the trash\n"
        << "  rename PATH NEW_NAME     rename in place\n"
        << "  touch NAME | mkdir NAME  create a file or directory\n"
        << "  undo                     reverse the last operation\n"
        << "  trash                    list trash entries\n"
        << "  cancel                   stop the running copy or move\n"
        << "  wait                     wait for queued operations\n"
        << "  quit                     leave\n";
}


fs::path ConsoleApp::resolve(const std::string& argument) const
{
    fs::path path = Utils::utf8_to_path(argument);
    if (argument == "~" || argument.starts_with("~/")) {
        if (const char* home = std::getenv("HOME"); home && *home) {
            path = fs::path(home) / Utils::utf8_to_path(argument.size() > 2 ? argument.substr(2) : std::string());
        }
    }
    if (path.is_relative()) {
        path = cwd / path;
    }
    return Utils::absolutize(path);
}


std::vector<fs::path> ConsoleApp::resolve_all(Args::const_iterator begin, Args::const_iterator end) const
{
    std::vector<fs::path> paths;
    for (auto it = begin; it != end; ++it) {
        paths.push_back(resolve(*it));
    }
    return paths;
}


void ConsoleApp::submit(Command command)
{
    const std::string label = describe(command);
    if (const auto id = session.submit(std::move(command))) {
        out << "[#" << *id << "] queued: " << label << "\n";
    }
}


void ConsoleApp::cmd_ls(const Args& args)
{
    bool show_hidden = settings.get_show_hidden();
    fs::path dir = cwd;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "-a") {
            show_hidden = true;
        } else {
            dir = resolve(args[i]);
        }
    }

    FileScanOptions options = FileScanOptions::All;
    if (show_hidden) {
        options = options | FileScanOptions::HiddenFiles;
    }
    for (const auto& entry : scanner.get_directory_entries(Utils::path_to_utf8(dir), options)) {
        const auto cached = sizes.peek(Utils::utf8_to_path(entry.full_path));
        out << fmt::format("{:>10}  {}{}\n", size_column(cached), entry.file_name, kind_suffix(entry.kind));
    }
}


void ConsoleApp::cmd_cd(const Args& args)
{
    const fs::path target = args.size() > 1 ? resolve(args[1]) : resolve("~");
    std::error_code ec;
    if (!fs::is_directory(target, ec)) {
        out << ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::NOT_A_DIRECTORY).message
            << " (" << Utils::path_to_utf8(target) << ")\n";
        return;
    }
    cwd = target;
}


void ConsoleApp::cmd_size(const Args& args)
{
    const std::vector<fs::path> paths = args.size() > 1 ? resolve_all(args.begin() + 1, args.end())
                                                        : std::vector<fs::path>{cwd};
    for (const auto& path : paths) {
        const SizeState state = sizes.size_of(path);
        if (state.is_computed()) {
            out << fmt::format("{:>10}  {}\n", Utils::format_file_size(state.bytes), Utils::path_to_utf8(path));
        } else {
            out << fmt::format("{:>10}  {} ({})\n", "?", Utils::path_to_utf8(path), state.reason);
        }
    }
}


void ConsoleApp::cmd_copy_or_move(const Args& args, bool move)
{
    if (args.size() < 3) {
        out << "usage: " << args.front() << " SRC... DEST\n";
        return;
    }
    const std::vector<fs::path> sources = resolve_all(args.begin() + 1, args.end() - 1);
    const fs::path destination = resolve(args.back());
    submit(move ? CommandBuilder::move(sources, destination) : CommandBuilder::copy(sources, destination));
}


void ConsoleApp::cmd_rm(const Args& args)
{
    submit(CommandBuilder::remove(resolve_all(args.begin() + 1, args.end())));
}


void ConsoleApp::cmd_rename(const Args& args)
{
    if (args.size() != 3) {
        out << "usage: rename PATH NEW_NAME\n";
        return;
    }
    submit(CommandBuilder::rename(resolve(args[1]), args[2]));
}


void ConsoleApp::cmd_create(const Args& args, CreationKind kind)
{
    if (args.size() != 2) {
        out << "usage: " << args.front() << " NAME\n";
        return;
    }
    const fs::path target = resolve(args[1]);
    submit(CommandBuilder::create(target.parent_path(), Utils::path_to_utf8(target.filename()), kind));
}


void ConsoleApp::cmd_undo()
{
    session.request_undo();
}


void ConsoleApp::cmd_trash()
{
    const std::vector<TrashEntry> entries = trash.list();
    if (entries.empty()) {
        out << "trash is empty (" << Utils::path_to_utf8(trash.root()) << ")\n";
        return;
    }
    for (const auto& entry : entries) {
        out << fmt::format("{:%Y-%m-%d %H:%M:%S}  {}  <- {}\n", fmt::localtime(entry.deleted_at),
                           entry.trash_name, Utils::path_to_utf8(entry.original_path));
    }
}


void ConsoleApp::cmd_cancel()
{
    if (!session.cancel_current()) {
        out << "nothing is running\n";
    }
}


std::vector<std::string> ConsoleApp::tokenize(const std::string& line)
{
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote) {
            if (ch == quote) {
                quote = 0;
            } else if (ch == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += ch;
            }
        } else if (ch == '\'' || ch == '"') {
            quote = ch;
            in_word = true;
        } else if (ch == '\\' && i + 1 < line.size()) {
            current += line[++i];
            in_word = true;
        } else if (ch == ' ' || ch == '\t') {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
        } else {
            current += ch;
            in_word = true;
        }
    }
    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}


std::optional<std::string> ConsoleApp::read_password_from_terminal(const std::string& prompt)
{
    std::fprintf(stderr, "%s ", prompt.c_str());
    std::fflush(stderr);

    termios original{};
    const bool restore = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original) == 0;
    if (restore) {
        termios silent = original;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent);
    }

    std::string line;
    const bool got_line = static_cast<bool>(std::getline(std::cin, line));

    if (restore) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
        std::fputc('\n', stderr);
    }
    if (!got_line) {
        Utils::wipe_string(line);
        return std::nullopt;
    }
    std::optional<std::string> credential(line);
    Utils::wipe_string(line);
    return credential;
}

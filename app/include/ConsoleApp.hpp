#ifndef CONSOLE_APP_HPP
#define CONSOLE_APP_HPP

#include "ElevationBackend.hpp"
#include "FileManagerSession.hpp"
#include "FileOperationEngine.hpp"
#include "FileScanner.hpp"
#include "OperationWorker.hpp"
#include "PrivilegeEscalationManager.hpp"
#include "Settings.hpp"
#include "SizeCache.hpp"
#include "TrashStore.hpp"
#include "UndoStack.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

/**
 * @brief Line-oriented front end: reads commands, submits them to the
 * session and prints its events.
 */
class ConsoleApp {
public:
    // Returns nullopt when input ended.
    using PasswordReader = std::function<std::optional<std::string>(const std::string& prompt)>;

    ConsoleApp(Settings& settings,
               std::filesystem::path start_dir,
               std::istream& in,
               std::ostream& out,
               PasswordReader password_reader = {},
               std::unique_ptr<IElevationBackend> elevation_backend = nullptr);
    ~ConsoleApp();

    int run();

    // Returns false when the line asks to quit.
    bool execute_line(const std::string& line);
    void drain_events();
    void wait_for_idle();

    const std::filesystem::path& current_directory() const;

    // Whitespace-separated words; single or double quotes group, backslash escapes.
    static std::vector<std::string> tokenize(const std::string& line);

private:
    using Args = std::vector<std::string>;

    void handle_pending_escalation();
    void print_event(const SessionEvent& event);
    void print_help();

    std::filesystem::path resolve(const std::string& argument) const;
    std::vector<std::filesystem::path> resolve_all(Args::const_iterator begin, Args::const_iterator end) const;
    void submit(Command command);

    void cmd_ls(const Args& args);
    void cmd_cd(const Args& args);
    void cmd_size(const Args& args);
    void cmd_copy_or_move(const Args& args, bool move);
    void cmd_rm(const Args& args);
    void cmd_rename(const Args& args);
    void cmd_create(const Args& args, CreationKind kind);
    void cmd_undo();
    void cmd_trash();
    void cmd_cancel();

    static std::optional<std::string> read_password_from_terminal(const std::string& prompt);

    Settings& settings;
    std::istream& in;
    std::ostream& out;
    PasswordReader password_reader;
    std::shared_ptr<spdlog::logger> ui_logger;
    std::filesystem::path cwd;

    FileScanner scanner;
    SizeCache sizes;
    TrashStore trash;
    FileOperationEngine engine;
    std::unique_ptr<IElevationBackend> backend;
    PrivilegeEscalationManager escalation;
    UndoStack undo_stack;
    OperationWorker worker;
    FileManagerSession session;
};

#endif

#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

struct ProcessResult {
    bool launched{false};
    int exit_code{-1};
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return launched && exit_code == 0; }
};

namespace Process {

/**
 * @brief Runs argv[0] (looked up in PATH) and waits for it.
 * @param argv Program and arguments; must not be empty.
 * @param stdin_data Written to the child's stdin, which is then closed. May be null.
 * @return Exit status and captured output. `launched` is false when the program could not be started.
 */
ProcessResult run(const std::vector<std::string>& argv, const std::string* stdin_data = nullptr);

}

#endif

#include "ElevationBackend.hpp"

#include <spdlog/spdlog.h>

#include <string.h>

SudoElevationBackend::SudoElevationBackend(std::string sudo_path,
                                           std::shared_ptr<spdlog::logger> logger)
    : sudo_path(std::move(sudo_path)),
      logger(std::move(logger))
{
}


CredentialCheck SudoElevationBackend::validate_credential(const std::string& credential)
{
    // -k ignores any cached ticket so the supplied password is really checked;
    // -v then leaves a fresh ticket for the following sudo -n call.
    std::string input;
    input.reserve(credential.size() + 1);
    input.append(credential);
    input.push_back('\n');
    const ProcessResult result = Process::run({sudo_path, "-k", "-S", "-p", "", "-v"}, &input);
    explicit_bzero(input.data(), input.size());

    if (!result.launched) {
        if (logger) {
            logger->error("Could not launch '{}' for credential validation", sudo_path);
        }
        return CredentialCheck::BackendUnavailable;
    }
    if (!result.succeeded()) {
        if (logger) {
            logger->warn("sudo rejected the supplied credential (exit {})", result.exit_code);
        }
        return CredentialCheck::Rejected;
    }
    return CredentialCheck::Accepted;
}


ProcessResult SudoElevationBackend::run_elevated(const std::vector<std::string>& argv)
{
    std::vector<std::string> command{sudo_path, "-n", "--"};
    command.insert(command.end(), argv.begin(), argv.end());
    ProcessResult result = Process::run(command);
    if (logger) {
        logger->debug("Elevated '{}' exited with {}", argv.empty() ? std::string() : argv.front(), result.exit_code);
    }
    return result;
}


void SudoElevationBackend::revoke()
{
    const ProcessResult result = Process::run({sudo_path, "-k"});
    if (!result.succeeded() && logger) {
        logger->warn("Failed to revoke sudo ticket (exit {}): {}", result.exit_code, result.stderr_text);
    }
}

#ifndef PRIVILEGE_ESCALATION_MANAGER_HPP
#define PRIVILEGE_ESCALATION_MANAGER_HPP

#include "Command.hpp"
#include "ErrorCode.hpp"
#include "FileOperationEngine.hpp"
#include "Outcome.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class IElevationBackend;
class PrivilegeEscalationManager;
namespace spdlog { class logger; }

enum class AuthError {InvalidCredential, BackendUnavailable, SessionInUse};

std::string to_string(AuthError error);
ErrorCodes::Code to_error_code(AuthError error);

// Process-wide escalation state, readable by anyone.
struct CredentialState {
    bool active{false};
    std::optional<std::chrono::system_clock::time_point> validated_at;
};

/**
 * @brief Permission to run elevated work, handed out by a successful escalate().
 *
 * Move-only and single-use: retrying consumes it, and destroying an unused
 * session clears the process-wide state and revokes the OS ticket. It never
 * holds credential bytes.
 */
class CredentialSession {
public:
    CredentialSession(const CredentialSession&) = delete;
    CredentialSession& operator=(const CredentialSession&) = delete;
    CredentialSession(CredentialSession&& other) noexcept;
    CredentialSession& operator=(CredentialSession&& other) noexcept;
    ~CredentialSession();

    bool valid() const noexcept { return owner_ != nullptr; }

private:
    friend class PrivilegeEscalationManager;
    CredentialSession(PrivilegeEscalationManager* owner, std::uint64_t id);
    void release() noexcept;

    PrivilegeEscalationManager* owner_{nullptr};
    std::uint64_t id_{0};
};

struct EscalationResult {
    std::optional<CredentialSession> session;
    std::optional<AuthError> error;

    bool ok() const { return session.has_value(); }
};

/**
 * @brief Turns a permission-denied command into one elevated retry.
 *
 * escalate() validates a credential through the backend and wipes the
 * caller's copy on every path. retry_with_escalation() applies exactly one
 * command through the elevated mutator and ends the session whatever the
 * result; a command still denied while elevated is reported as
 * Failed(PERMISSION_DENIED) and never retried again.
 */
class PrivilegeEscalationManager {
public:
    PrivilegeEscalationManager(FileOperationEngine& engine,
                               IElevationBackend& backend,
                               std::shared_ptr<spdlog::logger> logger = nullptr);

    EscalationResult escalate(std::string& credential);

    Outcome retry_with_escalation(const Command& command, CredentialSession session,
                                  const ApplyContext& context = {});

    // One session covers every command in order; the session ends after the last one.
    std::vector<Outcome> retry_batch_with_escalation(const std::vector<Command>& commands,
                                                     CredentialSession session,
                                                     const ApplyContext& context = {});

    CredentialState state() const;

private:
    friend class CredentialSession;

    bool is_current(const CredentialSession& session) const;
    Outcome apply_elevated(const Command& command, const ApplyContext& context);
    void end_session(std::uint64_t id) noexcept;

    FileOperationEngine& engine;
    IElevationBackend& backend;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex escalate_mutex;
    mutable std::mutex state_mutex;
    CredentialState current;
    std::uint64_t active_id{0};
    std::uint64_t next_id{1};
};

#endif

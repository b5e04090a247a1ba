#include "PrivilegeEscalationManager.hpp"

#include "ElevationBackend.hpp"
#include "FileMutator.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

namespace {

// Denied again while elevated: report it as final, keeping whatever did go through.
Outcome finalize_elevated(Outcome outcome)
{
    if (outcome.status != OutcomeStatus::PermissionDenied) {
        return outcome;
    }

    std::vector<TargetFailure> failures = std::move(outcome.failures);
    if (outcome.pending) {
        for (const auto& path : target_paths(*outcome.pending)) {
            failures.push_back({path, ErrorCodes::Code::PERMISSION_DENIED, outcome.message});
        }
    }
    if (outcome.executed) {
        return Outcome::success(std::move(*outcome.executed), std::move(failures));
    }
    return Outcome::failed(ErrorCodes::Code::PERMISSION_DENIED,
                           "permission denied even with elevated rights: " + outcome.message,
                           std::move(failures));
}

Outcome session_expired()
{
    return Outcome::failed(ErrorCodes::Code::AUTH_SESSION_EXPIRED,
                           ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::AUTH_SESSION_EXPIRED).get_user_message());
}

}


std::string to_string(AuthError error)
{
    switch (error) {
        case AuthError::InvalidCredential: return "InvalidCredential";
        case AuthError::BackendUnavailable: return "BackendUnavailable";
        case AuthError::SessionInUse: return "SessionInUse";
        default: return "Unknown";
    }
}


ErrorCodes::Code to_error_code(AuthError error)
{
    switch (error) {
        case AuthError::InvalidCredential: return ErrorCodes::Code::AUTH_INVALID_CREDENTIAL;
        case AuthError::BackendUnavailable: return ErrorCodes::Code::AUTH_BACKEND_UNAVAILABLE;
        case AuthError::SessionInUse: return ErrorCodes::Code::AUTH_SESSION_IN_USE;
        default: return ErrorCodes::Code::UNKNOWN_ERROR;
    }
}


CredentialSession::CredentialSession(PrivilegeEscalationManager* owner, std::uint64_t id)
    : owner_(owner),
      id_(id)
{
}


CredentialSession::CredentialSession(CredentialSession&& other) noexcept
    : owner_(other.owner_),
      id_(other.id_)
{
    other.owner_ = nullptr;
    other.id_ = 0;
}


CredentialSession& CredentialSession::operator=(CredentialSession&& other) noexcept
{
    if (this != &other) {
        release();
        owner_ = other.owner_;
        id_ = other.id_;
        other.owner_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}


CredentialSession::~CredentialSession()
{
    release();
}


void CredentialSession::release() noexcept
{
    if (owner_) {
        owner_->end_session(id_);
        owner_ = nullptr;
        id_ = 0;
    }
}


PrivilegeEscalationManager::PrivilegeEscalationManager(FileOperationEngine& engine,
                                                       IElevationBackend& backend,
                                                       std::shared_ptr<spdlog::logger> logger)
    : engine(engine),
      backend(backend),
      logger(std::move(logger))
{
}


CredentialState PrivilegeEscalationManager::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return current;
}


EscalationResult PrivilegeEscalationManager::escalate(std::string& credential)
{
    std::lock_guard<std::mutex> serial(escalate_mutex);
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (current.active) {
            Utils::wipe_string(credential);
            if (logger) {
                logger->warn("Escalation refused: another elevated session is active");
            }
            return {std::nullopt, AuthError::SessionInUse};
        }
    }

    const CredentialCheck check = backend.validate_credential(credential);
    Utils::wipe_string(credential);

    switch (check) {
        case CredentialCheck::Accepted:
            break;
        case CredentialCheck::Rejected:
            // A failed attempt must not leave any ticket behind.
            backend.revoke();
            if (logger) {
                logger->warn("Escalation failed: credential rejected");
            }
            return {std::nullopt, AuthError::InvalidCredential};
        case CredentialCheck::BackendUnavailable:
            if (logger) {
                logger->error("Escalation failed: elevation backend unavailable");
            }
            return {std::nullopt, AuthError::BackendUnavailable};
    }

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        id = next_id++;
        active_id = id;
        current.active = true;
        current.validated_at = std::chrono::system_clock::now();
    }
    if (logger) {
        logger->info("Elevated session {} opened", id);
    }
    return {CredentialSession(this, id), std::nullopt};
}


bool PrivilegeEscalationManager::is_current(const CredentialSession& session) const
{
    if (!session.valid() || session.owner_ != this) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_mutex);
    return current.active && active_id == session.id_;
}


Outcome PrivilegeEscalationManager::apply_elevated(const Command& command, const ApplyContext& context)
{
    ElevatedMutator mutator(backend);
    if (logger) {
        logger->info("Elevated retry: {}", describe(command));
    }
    return finalize_elevated(engine.apply_with(command, mutator, context));
}


Outcome PrivilegeEscalationManager::retry_with_escalation(const Command& command,
                                                          CredentialSession session,
                                                          const ApplyContext& context)
{
    if (!is_current(session)) {
        if (logger) {
            logger->warn("Elevated retry refused: session is not active");
        }
        return session_expired();
    }

    Outcome outcome = apply_elevated(command, context);
    session.release();
    return outcome;
}


std::vector<Outcome> PrivilegeEscalationManager::retry_batch_with_escalation(const std::vector<Command>& commands,
                                                                             CredentialSession session,
                                                                             const ApplyContext& context)
{
    std::vector<Outcome> outcomes;
    outcomes.reserve(commands.size());
    if (!is_current(session)) {
        if (logger) {
            logger->warn("Elevated batch refused: session is not active");
        }
        for (std::size_t i = 0; i < commands.size(); ++i) {
            outcomes.push_back(session_expired());
        }
        return outcomes;
    }

    for (const auto& command : commands) {
        outcomes.push_back(apply_elevated(command, context));
    }
    session.release();
    return outcomes;
}


void PrivilegeEscalationManager::end_session(std::uint64_t id) noexcept
{
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!current.active || active_id != id) {
            return;
        }
        active_id = 0;
        current = CredentialState{};
    }

    try {
        backend.revoke();
    } catch (const std::exception& ex) {
        if (logger) {
            logger->error("Revoking elevated session {} failed: {}", id, ex.what());
        }
        return;
    }
    if (logger) {
        logger->info("Elevated session {} closed", id);
    }
}

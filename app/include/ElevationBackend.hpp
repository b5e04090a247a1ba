#ifndef ELEVATION_BACKEND_HPP
#define ELEVATION_BACKEND_HPP

#include "Process.hpp"

#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

enum class CredentialCheck {Accepted, Rejected, BackendUnavailable};

/**
 * @brief Operating-system side of privilege escalation.
 *
 * Implementations never keep the credential: it is used for one validation and
 * the OS keeps whatever ticket results until revoke() is called.
 */
class IElevationBackend {
public:
    virtual ~IElevationBackend() = default;

    virtual CredentialCheck validate_credential(const std::string& credential) = 0;
    virtual ProcessResult run_elevated(const std::vector<std::string>& argv) = 0;
    virtual void revoke() = 0;
};

// sudo -k -S -v to validate, sudo -n to run, sudo -k to revoke.
class SudoElevationBackend : public IElevationBackend {
public:
    explicit SudoElevationBackend(std::string sudo_path = "sudo",
                                  std::shared_ptr<spdlog::logger> logger = nullptr);

    CredentialCheck validate_credential(const std::string& credential) override;
    ProcessResult run_elevated(const std::vector<std::string>& argv) override;
    void revoke() override;

private:
    std::string sudo_path;
    std::shared_ptr<spdlog::logger> logger;
};

#endif

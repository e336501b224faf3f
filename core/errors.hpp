#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace core {

// Who has to act on an error: the caller, by fixing the request, or the
// operator, because the service could not provide an isolated environment.
enum class ErrorCategory { CALLER_ERROR, SERVICE_ERROR };

class codebox_error : public std::runtime_error {
 public:
  codebox_error(const char* kind, ErrorCategory category,
                const std::string& what)
      : std::runtime_error(what), kind_(kind), category_(category) {}

  // Stable identifier of the error class, e.g. "validation_error".
  const char* Kind() const { return kind_; }
  ErrorCategory Category() const { return category_; }
  bool IsCallerError() const {
    return category_ == ErrorCategory::CALLER_ERROR;
  }

 private:
  const char* kind_;
  ErrorCategory category_;
};

#define CODEBOX_ERROR(name, category)                               \
  class name : public codebox_error {                               \
   public:                                                          \
    explicit name(const std::string& what)                          \
        : codebox_error(#name, ErrorCategory::category, what) {}    \
  }

// No usable isolation substrate was found. Fatal at startup.
CODEBOX_ERROR(backend_unavailable, SERVICE_ERROR);
// The VM could not be created or reached after the configured retries.
CODEBOX_ERROR(vm_setup_error, SERVICE_ERROR);
// A container, or the interpreter inside it, could not be started.
CODEBOX_ERROR(container_start_failure, SERVICE_ERROR);
// A file could not be copied in or out of an isolated environment.
CODEBOX_ERROR(transfer_error, SERVICE_ERROR);
// Code or dependencies were rejected before any resource was used.
CODEBOX_ERROR(validation_error, CALLER_ERROR);
// The interpreter did not become idle in time.
CODEBOX_ERROR(execution_timeout, CALLER_ERROR);
CODEBOX_ERROR(session_not_found, CALLER_ERROR);
// The session is not ready: busy, in error or being provisioned.
CODEBOX_ERROR(session_busy, CALLER_ERROR);
// A validated dependency failed to install. The session stays usable.
CODEBOX_ERROR(dependency_install_error, CALLER_ERROR);
CODEBOX_ERROR(result_not_ready, CALLER_ERROR);
CODEBOX_ERROR(request_not_found, CALLER_ERROR);
CODEBOX_ERROR(artifact_not_found, CALLER_ERROR);

#undef CODEBOX_ERROR

const char* CategoryName(ErrorCategory category);

}  // namespace core

#endif

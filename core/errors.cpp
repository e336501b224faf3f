#include "core/errors.hpp"

namespace core {

const char* CategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::CALLER_ERROR:
      return "caller error";
    case ErrorCategory::SERVICE_ERROR:
      return "service error";
  }
  return "unknown";
}

}  // namespace core

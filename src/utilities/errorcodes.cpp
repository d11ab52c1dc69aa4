#include "utilities/errors.h"
#include "utilities/logger.h"

namespace wttp {

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::PermissionDenied:
    return "PermissionDenied";
  case ErrorKind::ResourceImmutable:
    return "ResourceImmutable";
  case ErrorKind::OutOfBoundsChunk:
    return "OutOfBoundsChunk";
  case ErrorKind::InsufficientPayment:
    return "InsufficientPayment";
  case ErrorKind::InsufficientBalance:
    return "InsufficientBalance";
  case ErrorKind::MalformedParameter:
    return "MalformedParameter";
  case ErrorKind::InvalidState:
    return "InvalidState";
  }
  return "Unknown";
}

void ThrowPermissionDenied(const std::string &caller, const std::string &action,
                           const std::string &target) {
  std::string msg = "Permission denied: " + caller + " may not " + action +
                    " " + target;
  Logger::getInstance().log(LogLevel::ERROR, msg,
                            {{"error", "PermissionDenied"},
                             {"caller", caller},
                             {"action", action},
                             {"target", target}});
  throw PermissionDenied(msg);
}

void ThrowResourceImmutable(const std::string &path) {
  Logger::getInstance().log(LogLevel::ERROR,
                            "Mutation rejected on immutable resource",
                            {{"error", "ResourceImmutable"}, {"path", path}});
  throw ResourceImmutable(path);
}

void ThrowOutOfBoundsChunk(const std::string &path, uint64_t index,
                           uint64_t length) {
  Logger::getInstance().log(LogLevel::ERROR, "Chunk index out of bounds",
                            {{"error", "OutOfBoundsChunk"},
                             {"path", path},
                             {"index", std::to_string(index)},
                             {"length", std::to_string(length)}});
  throw OutOfBoundsChunk(path, index, length);
}

void ThrowInsufficientPayment(uint64_t required, uint64_t offered) {
  Logger::getInstance().log(LogLevel::ERROR, "Royalty payment too low",
                            {{"error", "InsufficientPayment"},
                             {"required", std::to_string(required)},
                             {"offered", std::to_string(offered)}});
  throw InsufficientPayment(required, offered);
}

void ThrowInsufficientBalance(const std::string &account, uint64_t requested,
                              uint64_t available) {
  Logger::getInstance().log(LogLevel::ERROR, "Withdrawal exceeds balance",
                            {{"error", "InsufficientBalance"},
                             {"account", account},
                             {"requested", std::to_string(requested)},
                             {"available", std::to_string(available)}});
  throw InsufficientBalance(requested, available);
}

void ThrowMalformedParameter(const std::string &message) {
  Logger::getInstance().log(LogLevel::ERROR, message,
                            {{"error", "MalformedParameter"}});
  throw MalformedParameter(message);
}

void ThrowInvalidState(const std::string &message) {
  Logger::getInstance().log(LogLevel::ERROR, message,
                            {{"error", "InvalidState"}});
  throw InvalidState(message);
}

} // namespace wttp

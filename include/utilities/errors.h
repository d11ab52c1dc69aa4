#pragma once
#ifndef WTTP_ERRORS_H
#define WTTP_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wttp {

enum class ErrorKind {
  PermissionDenied,
  ResourceImmutable,
  OutOfBoundsChunk,
  InsufficientPayment,
  InsufficientBalance,
  MalformedParameter,
  InvalidState
};

std::string errorKindToString(ErrorKind kind);

/**
 * @brief Base class for every hard failure raised by the store.
 *
 * Conditions that are part of normal protocol flow (404, 304, 416, ...) are
 * never thrown; they are reported through response status codes.
 */
class WttpException : public std::runtime_error {
public:
  WttpException(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class PermissionDenied : public WttpException {
public:
  explicit PermissionDenied(const std::string &message)
      : WttpException(ErrorKind::PermissionDenied, message) {}
};

class ResourceImmutable : public WttpException {
public:
  explicit ResourceImmutable(const std::string &path)
      : WttpException(ErrorKind::ResourceImmutable,
                      "Resource is immutable: " + path),
        path_(path) {}

  const std::string &path() const noexcept { return path_; }

private:
  std::string path_;
};

class OutOfBoundsChunk : public WttpException {
public:
  OutOfBoundsChunk(const std::string &path, uint64_t index, uint64_t length)
      : WttpException(ErrorKind::OutOfBoundsChunk,
                      "Chunk index " + std::to_string(index) +
                          " out of bounds for " + path + " (length " +
                          std::to_string(length) + ")"),
        index_(index), length_(length) {}

  uint64_t index() const noexcept { return index_; }
  uint64_t length() const noexcept { return length_; }

private:
  uint64_t index_;
  uint64_t length_;
};

class InsufficientPayment : public WttpException {
public:
  InsufficientPayment(uint64_t required, uint64_t offered)
      : WttpException(ErrorKind::InsufficientPayment,
                      "Insufficient payment: required " +
                          std::to_string(required) + ", offered " +
                          std::to_string(offered)),
        required_(required), offered_(offered) {}

  uint64_t required() const noexcept { return required_; }
  uint64_t offered() const noexcept { return offered_; }

private:
  uint64_t required_;
  uint64_t offered_;
};

class InsufficientBalance : public WttpException {
public:
  InsufficientBalance(uint64_t requested, uint64_t available)
      : WttpException(ErrorKind::InsufficientBalance,
                      "Insufficient balance: requested " +
                          std::to_string(requested) + ", available " +
                          std::to_string(available)) {}
};

class MalformedParameter : public WttpException {
public:
  explicit MalformedParameter(const std::string &message)
      : WttpException(ErrorKind::MalformedParameter, message) {}
};

class InvalidState : public WttpException {
public:
  explicit InvalidState(const std::string &message)
      : WttpException(ErrorKind::InvalidState, message) {}
};

// The Throw* helpers log the failure at ERROR level before throwing.
[[noreturn]] void ThrowPermissionDenied(const std::string &caller,
                                        const std::string &action,
                                        const std::string &target);
[[noreturn]] void ThrowResourceImmutable(const std::string &path);
[[noreturn]] void ThrowOutOfBoundsChunk(const std::string &path,
                                        uint64_t index, uint64_t length);
[[noreturn]] void ThrowInsufficientPayment(uint64_t required,
                                           uint64_t offered);
[[noreturn]] void ThrowInsufficientBalance(const std::string &account,
                                           uint64_t requested,
                                           uint64_t available);
[[noreturn]] void ThrowMalformedParameter(const std::string &message);
[[noreturn]] void ThrowInvalidState(const std::string &message);

} // namespace wttp

#endif // WTTP_ERRORS_H

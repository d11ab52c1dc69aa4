#ifndef WTTP_AUDIT_LOG_HPP
#define WTTP_AUDIT_LOG_HPP

#include <ctime>
#include <mutex>
#include <string>
#include <vector>

#include "utilities/digest.hpp"

namespace wttp {

/**
 * @brief Append-only stream of committed state changes.
 *
 * Each event is hashed together with the previous event's hash to create an
 * immutable chain that external indexers can replay and verify.
 */
class AuditLog {
public:
  /**
   * @brief Representation of a single audit event.
   */
  struct Event {
    std::string type;    ///< CREATE, UPDATE, DELETE, DEFINE, MALFORMED, ROYALTY, PAYOUT
    std::string subject; ///< Resource path or account the event concerns
    std::string detail;  ///< Free-form detail (chunk index, amount, reason)
    std::time_t ts;      ///< Event timestamp
    Digest prevHash;     ///< Hash of previous event
    Digest hash;         ///< Hash of this event
  };

  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  /** Obtain the singleton instance. */
  static AuditLog &getInstance();

  /** Reset the log (primarily for tests). */
  void clear();

  void recordCreate(const std::string &path, const std::string &detail = "");
  void recordUpdate(const std::string &path, const std::string &detail = "");
  void recordDelete(const std::string &path);
  void recordDefine(const std::string &path, const std::string &headerCid);
  void recordMalformed(const std::string &subject, const std::string &reason);
  void recordRoyalty(const std::string &publisher, const std::string &detail);
  void recordPayout(const std::string &account, const std::string &detail);

  /** Snapshot of recorded events. */
  std::vector<Event> events() const;

  /** Events of a single type, oldest first. */
  std::vector<Event> eventsOfType(const std::string &type) const;

  /** Verify the integrity of the chain. */
  bool verify() const;

private:
  AuditLog() = default;
  Digest appendEvent(const std::string &type, const std::string &subject,
                     const std::string &detail);
  static Digest hashEvent(const Digest &prev, const std::string &type,
                          const std::string &subject,
                          const std::string &detail, std::time_t ts);

  mutable std::mutex mutex_;
  std::vector<Event> log_;
};

} // namespace wttp

#endif // WTTP_AUDIT_LOG_HPP

#include "utilities/audit_log.hpp"
#include "utilities/hasher.hpp"

namespace wttp {

AuditLog &AuditLog::getInstance() {
  static AuditLog instance;
  return instance;
}

void AuditLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  log_.clear();
}

void AuditLog::recordCreate(const std::string &path,
                            const std::string &detail) {
  appendEvent("CREATE", path, detail);
}

void AuditLog::recordUpdate(const std::string &path,
                            const std::string &detail) {
  appendEvent("UPDATE", path, detail);
}

void AuditLog::recordDelete(const std::string &path) {
  appendEvent("DELETE", path, "");
}

void AuditLog::recordDefine(const std::string &path,
                            const std::string &headerCid) {
  appendEvent("DEFINE", path, headerCid);
}

void AuditLog::recordMalformed(const std::string &subject,
                               const std::string &reason) {
  appendEvent("MALFORMED", subject, reason);
}

void AuditLog::recordRoyalty(const std::string &publisher,
                             const std::string &detail) {
  appendEvent("ROYALTY", publisher, detail);
}

void AuditLog::recordPayout(const std::string &account,
                            const std::string &detail) {
  appendEvent("PAYOUT", account, detail);
}

std::vector<AuditLog::Event> AuditLog::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return log_;
}

std::vector<AuditLog::Event>
AuditLog::eventsOfType(const std::string &type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Event> out;
  for (const auto &e : log_) {
    if (e.type == type)
      out.push_back(e);
  }
  return out;
}

Digest AuditLog::hashEvent(const Digest &prev, const std::string &type,
                           const std::string &subject,
                           const std::string &detail, std::time_t ts) {
  Hasher h(HashAlgorithm::SHA256);
  h.ingestDigest(prev);
  h.ingestString(type);
  h.ingestString(subject);
  h.ingestString(detail);
  h.ingestU64(static_cast<uint64_t>(ts));
  return h.finalize();
}

Digest AuditLog::appendEvent(const std::string &type,
                             const std::string &subject,
                             const std::string &detail) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::time_t ts = std::time(nullptr);
  Digest prev = log_.empty() ? ZERO_DIGEST : log_.back().hash;
  Digest hash = hashEvent(prev, type, subject, detail, ts);
  log_.push_back(Event{type, subject, detail, ts, prev, hash});
  return hash;
}

bool AuditLog::verify() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Digest prev = ZERO_DIGEST;
  for (const auto &e : log_) {
    if (e.prevHash != prev)
      return false;
    if (hashEvent(prev, e.type, e.subject, e.detail, e.ts) != e.hash)
      return false;
    prev = e.hash;
  }
  return true;
}

} // namespace wttp

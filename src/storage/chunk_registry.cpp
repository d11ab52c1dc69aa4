#include "storage/chunk_registry.hpp"
#include "utilities/audit_log.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace wttp {

ChunkRegistry::ChunkRegistry(ChunkStore &store, Identity owner,
                             RoyaltyPolicy policy)
    : store_(store), owner_(std::move(owner)), policy_(policy) {
  if (policy_.publisherSharePercent > 100) {
    ThrowMalformedParameter("publisher share above 100 percent: " +
                            std::to_string(policy_.publisherSharePercent));
  }
}

uint64_t ChunkRegistry::estimateCost(uint64_t size) const {
  uint64_t words = (size + 31) / 32;
  return policy_.baseCost + policy_.costPerWord * words;
}

Amount ChunkRegistry::royaltyForLocked(const Digest &address,
                                       const Identity &caller) const {
  auto it = records_.find(address);
  if (it == records_.end() || it->second.publisher.empty() ||
      it->second.publisher == caller) {
    return 0;
  }
  return it->second.cost * policy_.rate;
}

Amount ChunkRegistry::quote(const Bytes &data, const Identity &caller) const {
  Digest address = ChunkStore::addressOf(data);
  std::lock_guard<std::mutex> lock(mutex_);
  return royaltyForLocked(address, caller);
}

std::optional<RoyaltyRecord>
ChunkRegistry::record(const Digest &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(address);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Amount ChunkRegistry::balanceOf(const Identity &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

// Credits stay pending until tx commits, so collect() never sees them early.
void ChunkRegistry::credit(Transaction &tx, const Identity &account,
                           Amount amount) {
  if (amount == 0) {
    return;
  }
  tx.onCommit([this, account, amount] {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[account] += amount;
  });
}

Registration ChunkRegistry::registerChunk(Transaction &tx, const Bytes &data,
                                          const Identity &publisher,
                                          const Identity &caller,
                                          Amount payment) {
  Registration result;
  std::lock_guard<std::mutex> lock(mutex_);
  result.address = ChunkStore::addressOf(data);

  auto it = records_.find(result.address);
  if (it == records_.end()) {
    store_.write(data);
    records_.emplace(result.address,
                     RoyaltyRecord{estimateCost(data.size()), publisher});
    const Digest address = result.address;
    tx.onRollback([this, address] {
      std::lock_guard<std::mutex> guard(mutex_);
      records_.erase(address);
    });
    result.created = true;
    return result;
  }

  MetricsRegistry::instance().incrementCounter(
      "wttp_chunks_deduplicated_total");
  Amount due = royaltyForLocked(result.address, caller);
  if (due == 0) {
    return result;
  }
  if (payment < due) {
    ThrowInsufficientPayment(due, payment);
  }

  Amount publisherShare = due * policy_.publisherSharePercent / 100;
  Amount fee = due - publisherShare;
  const Identity recipient = it->second.publisher;
  credit(tx, recipient, publisherShare);
  credit(tx, owner_, fee);
  result.royaltyPaid = due;

  std::string detail = digestToCid(result.address, HashAlgorithm::BLAKE3) +
                       " paid=" + std::to_string(due) +
                       " payer=" + caller;
  tx.onCommit([recipient, detail, due] {
    AuditLog::getInstance().recordRoyalty(recipient, detail);
    MetricsRegistry::instance().incrementCounter(
        "wttp_royalties_paid_total", static_cast<double>(due));
  });
  Logger::getInstance().log(LogLevel::INFO, "Royalty charged",
                            {{"payer", caller},
                             {"publisher", recipient},
                             {"amount", std::to_string(due)}});
  return result;
}

Payout ChunkRegistry::collect(const Identity &caller, Amount amount,
                              const Identity &destination) {
  std::lock_guard<std::mutex> lock(mutex_);
  Amount available = 0;
  auto it = balances_.find(caller);
  if (it != balances_.end()) {
    available = it->second;
  }
  if (amount > available) {
    ThrowInsufficientBalance(caller, amount, available);
  }
  if (amount > 0) {
    it->second -= amount;
  }

  AuditLog::getInstance().recordPayout(caller, "to=" + destination +
                                                   " amount=" +
                                                   std::to_string(amount));
  Logger::getInstance().log(LogLevel::INFO, "Royalties collected",
                            {{"account", caller},
                             {"destination", destination},
                             {"amount", std::to_string(amount)}});
  return Payout{caller, destination, amount};
}

YAML::Node ChunkRegistry::exportState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  YAML::Node node;
  YAML::Node records(YAML::NodeType::Sequence);
  for (const auto &kv : records_) {
    YAML::Node entry;
    entry["address"] = digestToCid(kv.first, HashAlgorithm::BLAKE3);
    entry["cost"] = kv.second.cost;
    entry["publisher"] = kv.second.publisher;
    records.push_back(entry);
  }
  YAML::Node balances(YAML::NodeType::Map);
  for (const auto &kv : balances_) {
    balances[kv.first] = kv.second;
  }
  node["records"] = records;
  node["balances"] = balances;
  return node;
}

void ChunkRegistry::importState(const YAML::Node &node) {
  if (!node) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (node["records"]) {
    for (const auto &entry : node["records"]) {
      Digest address = cidToDigest(entry["address"].as<std::string>());
      records_[address] = RoyaltyRecord{entry["cost"].as<uint64_t>(),
                                        entry["publisher"].as<std::string>()};
    }
  }
  if (node["balances"]) {
    for (const auto &kv : node["balances"]) {
      balances_[kv.first.as<std::string>()] = kv.second.as<Amount>();
    }
  }
}

} // namespace wttp

#ifndef WTTP_CHUNK_REGISTRY_HPP
#define WTTP_CHUNK_REGISTRY_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

#include "storage/chunk_store.hpp"
#include "storage/transaction.hpp"
#include "storage/types.hpp"

namespace wttp {

/// Cost basis and publisher recorded on the first write of a chunk.
struct RoyaltyRecord {
  uint64_t cost = 0;
  Identity publisher; ///< Empty waives royalties permanently.
};

/// Economics of the registry.
struct RoyaltyPolicy {
  Amount rate = 1;                     ///< Royalty per unit of recorded cost
  unsigned publisherSharePercent = 90; ///< Remainder goes to the owner
  uint64_t baseCost = 21000;           ///< Fixed part of the write estimate
  uint64_t costPerWord = 20000;        ///< Per started 32-byte word
};

struct Registration {
  Digest address{};
  Amount royaltyPaid = 0;
  bool created = false; ///< First write of these bytes
};

struct Payout {
  Identity from;
  Identity to;
  Amount amount = 0;
};

/**
 * @brief Royalty ledger layered over the chunk store.
 *
 * The first writer of a chunk becomes its publisher. Later writers of the
 * same bytes pay cost * rate, split between the publisher and the registry
 * owner.
 */
class ChunkRegistry {
public:
  ChunkRegistry(ChunkStore &store, Identity owner, RoyaltyPolicy policy = {});

  /**
   * @brief Store a chunk and settle the royalty owed for it.
   *
   * Balance credits are applied when @p tx commits. A royalty record
   * created here is dropped if @p tx rolls back; the chunk bytes stay.
   *
   * @param payment Value the caller makes available for this chunk.
   * @throw InsufficientPayment If @p payment is below the royalty due.
   */
  Registration registerChunk(Transaction &tx, const Bytes &data,
                             const Identity &publisher, const Identity &caller,
                             Amount payment);

  /// Royalty @p caller would owe for @p data; nothing is written.
  Amount quote(const Bytes &data, const Identity &caller) const;

  /// First-write cost estimate for a chunk of @p size bytes.
  uint64_t estimateCost(uint64_t size) const;

  std::optional<RoyaltyRecord> record(const Digest &address) const;

  Amount balanceOf(const Identity &account) const;

  /**
   * @brief Withdraw credited royalties.
   * @throw InsufficientBalance If @p amount exceeds the caller's balance.
   */
  Payout collect(const Identity &caller, Amount amount,
                 const Identity &destination);

  const ChunkStore &store() const { return store_; }
  const Identity &owner() const { return owner_; }
  const RoyaltyPolicy &policy() const { return policy_; }

  YAML::Node exportState() const;
  void importState(const YAML::Node &node);

private:
  Amount royaltyForLocked(const Digest &address, const Identity &caller) const;
  void credit(Transaction &tx, const Identity &account, Amount amount);

  ChunkStore &store_;
  Identity owner_;
  RoyaltyPolicy policy_;

  mutable std::mutex mutex_;
  std::unordered_map<Digest, RoyaltyRecord, DigestHash> records_;
  std::unordered_map<Identity, Amount> balances_;
};

} // namespace wttp

#endif // WTTP_CHUNK_REGISTRY_HPP

#ifndef WTTP_CONTENT_TABLE_HPP
#define WTTP_CONTENT_TABLE_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "utilities/digest.hpp"

namespace wttp {

/**
 * @brief Content-addressed, de-duplicating, append-only table.
 *
 * Values live in an arena and are found through a digest index. Nothing is
 * ever erased or overwritten, so the pointers returned by find() stay valid
 * for the lifetime of the table and equality is always by digest.
 */
template <typename T> class ContentTable {
public:
  using AddressFn = std::function<Digest(const T &)>;

  explicit ContentTable(AddressFn address) : address_(std::move(address)) {}

  ContentTable(const ContentTable &) = delete;
  ContentTable &operator=(const ContentTable &) = delete;

  /**
   * @brief Store @p value unless an equal value is already present.
   * @return The value's digest and whether it was newly inserted.
   */
  std::pair<Digest, bool> intern(const T &value) {
    Digest key = address_(value);
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(key)) {
      return {key, false};
    }
    arena_.emplace_back(key, value);
    index_.emplace(key, arena_.size() - 1);
    return {key, true};
  }

  /**
   * @brief Insert under a precomputed digest (state restore).
   * @return false if the digest was already present.
   */
  bool insertAt(const Digest &key, T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(key)) {
      return false;
    }
    arena_.emplace_back(key, std::move(value));
    index_.emplace(key, arena_.size() - 1);
    return true;
  }

  Digest addressOf(const T &value) const { return address_(value); }

  bool contains(const Digest &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(key) > 0;
  }

  /// @return nullptr if @p key is unknown.
  const T *find(const Digest &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    return &arena_[it->second].second;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return arena_.size();
  }

  /// Visit entries in insertion order.
  template <typename Fn> void forEach(Fn &&fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : arena_) {
      fn(entry.first, entry.second);
    }
  }

private:
  AddressFn address_;
  mutable std::mutex mutex_;
  std::deque<std::pair<Digest, T>> arena_;
  std::unordered_map<Digest, size_t, DigestHash> index_;
};

} // namespace wttp

#endif // WTTP_CONTENT_TABLE_HPP

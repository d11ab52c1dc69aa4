#ifndef WTTP_TRANSACTION_HPP
#define WTTP_TRANSACTION_HPP

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace wttp {

/**
 * @brief RAII undo journal giving a verb all-or-nothing semantics.
 *
 * Mutations register an undo action before they touch state and may queue
 * commit hooks (audit events, metrics). commit() runs the hooks and drops the
 * undo actions; destroying an uncommitted transaction replays the undo
 * actions in reverse order.
 */
class Transaction {
public:
  explicit Transaction(std::string label);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void onRollback(std::function<void()> undo);
  void onCommit(std::function<void()> hook);

  /**
   * @brief Records a per-transaction marker.
   * @return true the first time @p key is marked in this transaction.
   */
  bool mark(const std::string &key);
  bool marked(const std::string &key) const;

  void commit();
  bool committed() const { return committed_; }
  const std::string &label() const { return label_; }

private:
  void rollback() noexcept;

  std::string label_;
  std::vector<std::function<void()>> undo_;
  std::vector<std::function<void()>> hooks_;
  std::unordered_set<std::string> marks_;
  bool committed_ = false;
};

} // namespace wttp

#endif // WTTP_TRANSACTION_HPP

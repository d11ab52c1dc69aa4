#include "storage/transaction.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

namespace wttp {

Transaction::Transaction(std::string label) : label_(std::move(label)) {}

Transaction::~Transaction() {
  if (!committed_) {
    rollback();
  }
}

void Transaction::onRollback(std::function<void()> undo) {
  if (committed_) {
    ThrowInvalidState("Transaction already committed: " + label_);
  }
  undo_.push_back(std::move(undo));
}

void Transaction::onCommit(std::function<void()> hook) {
  if (committed_) {
    ThrowInvalidState("Transaction already committed: " + label_);
  }
  hooks_.push_back(std::move(hook));
}

bool Transaction::mark(const std::string &key) {
  return marks_.insert(key).second;
}

bool Transaction::marked(const std::string &key) const {
  return marks_.count(key) > 0;
}

void Transaction::commit() {
  if (committed_) {
    ThrowInvalidState("Transaction committed twice: " + label_);
  }
  committed_ = true;
  undo_.clear();
  for (auto &hook : hooks_) {
    hook();
  }
  hooks_.clear();
}

void Transaction::rollback() noexcept {
  if (undo_.empty()) {
    return;
  }
  try {
    Logger::getInstance().log(LogLevel::WARN, "Rolling back transaction",
                              {{"transaction", label_},
                               {"actions", std::to_string(undo_.size())}});
  } catch (const std::exception &e) {
    std::cerr << "Rollback of " << label_ << " could not be logged: "
              << e.what() << std::endl;
  }
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    try {
      (*it)();
    } catch (const std::exception &e) {
      std::cerr << "Undo action failed in " << label_ << ": " << e.what()
                << std::endl;
    }
  }
  undo_.clear();
}

} // namespace wttp

#include "storage/transaction.hpp"
#include "utilities/errors.h"

#include <gtest/gtest.h>

using namespace wttp;

TEST(TransactionTest, RollbackRunsInReverseOrder) {
  std::vector<int> order;
  {
    Transaction tx("test");
    tx.onRollback([&] { order.push_back(1); });
    tx.onRollback([&] { order.push_back(2); });
    tx.onCommit([&] { order.push_back(99); });
  }
  EXPECT_EQ(order, (std::vector<int>{2, 1}));
}

TEST(TransactionTest, CommitRunsHooksAndDropsUndo) {
  std::vector<int> order;
  {
    Transaction tx("test");
    tx.onRollback([&] { order.push_back(1); });
    tx.onCommit([&] { order.push_back(10); });
    tx.onCommit([&] { order.push_back(11); });
    tx.commit();
    EXPECT_TRUE(tx.committed());
  }
  EXPECT_EQ(order, (std::vector<int>{10, 11}));
}

TEST(TransactionTest, DoubleCommitIsInvalid) {
  Transaction tx("twice");
  tx.commit();
  EXPECT_THROW(tx.commit(), InvalidState);
}

TEST(TransactionTest, MarksAreFirstTimeOnly) {
  Transaction tx("marks");
  EXPECT_FALSE(tx.marked("version:/a"));
  EXPECT_TRUE(tx.mark("version:/a"));
  EXPECT_FALSE(tx.mark("version:/a"));
  EXPECT_TRUE(tx.marked("version:/a"));
  EXPECT_EQ(tx.label(), "marks");
}

TEST(TransactionTest, FailingUndoDoesNotStopRollback) {
  int undone = 0;
  {
    Transaction tx("failing");
    tx.onRollback([&] { ++undone; });
    tx.onRollback([] { throw std::runtime_error("undo failed"); });
  }
  EXPECT_EQ(undone, 1);
}

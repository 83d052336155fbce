#include "dopt/diag/FailManager.hpp"
#include <gtest/gtest.h>

using namespace dopt;

TEST(policy_fail, cause_uid_prefers_related_failures) {
  diag::FailManager fails;
  fails.push(Error::invalid_value("--a", "x", Uid{0}));
  fails.push(Error::invalid_value("--b", "y", Uid{1}));

  Error top = Error::option_required("--b");
  top.with_uid(Uid{1});
  Error chained = fails.cause_uid(top);
  ASSERT_NE(chained.cause(), nullptr);
  EXPECT_EQ(chained.cause()->uid(), std::optional<Uid>(Uid{1}));
  EXPECT_EQ(chained.cause()->cause(), nullptr);
}

TEST(policy_fail, cause_uid_falls_back_to_all) {
  diag::FailManager fails;
  fails.push(Error::invalid_value("--a", "x", Uid{0}));
  fails.push(Error::invalid_value("--b", "y", Uid{1}));

  Error top = Error::option_required("--c");
  top.with_uid(Uid{2});
  Error chained = fails.cause_uid(top);
  ASSERT_NE(chained.cause(), nullptr);
  ASSERT_NE(chained.cause()->cause(), nullptr);
  EXPECT_EQ(chained.cause()->uid(), std::optional<Uid>(Uid{0}));
  EXPECT_EQ(chained.cause()->cause()->uid(), std::optional<Uid>(Uid{1}));
}

TEST(policy_fail, chain_message) {
  Error top = Error::not_found("--x");
  top.caused_by(Error::failure("first"));
  top.caused_by(Error::failure("second"));
  EXPECT_EQ(top.chain(),
            "no option matched `--x`: caused by: first: caused by: second");
  EXPECT_EQ(fmt::format("{}", top), top.chain());
}

TEST(policy_fail, option_failure_since_mark) {
  diag::FailManager fails;
  fails.push(Error::invalid_value("--a", "x", Uid{0}));
  std::size_t mark = fails.size();
  EXPECT_FALSE(fails.option_failure_since(mark).has_value());
  fails.push(Error::failure("callback"));
  fails.push(Error::missing_value("--b", Uid{1}));
  auto found = fails.option_failure_since(mark);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->kind(), ErrorKind::MissingValue);
}

TEST(policy_fail, kinds) {
  EXPECT_TRUE(Error::not_found("x").is_failure());
  EXPECT_FALSE(Error::not_found("x").is_recoverable());
  EXPECT_FALSE(Error::invalid_uid(Uid{1}).is_failure());
  EXPECT_EQ(fmt::format("{}", ErrorKind::CmdRequired), "cmd-required");
}

#include "dopt/set/OptSet.hpp"
#include <gtest/gtest.h>

using namespace dopt;

TEST(set_optset, uids_follow_registration_order) {
  OptSet set;
  Uid a = set.add("-a");
  Uid b = set.add("--bee=s");
  EXPECT_EQ(*a, 0u);
  EXPECT_EQ(*b, 1u);
  EXPECT_EQ(set.size(), 2u);
  EXPECT_EQ(set[b].hint(), "--bee");
  EXPECT_EQ(set.str(set[b].prefix()), "--");
  EXPECT_EQ(set.str(set[b].name()), "bee");
}

TEST(set_optset, prefixes_longest_first) {
  OptSet set;
  set.add_prefix("+");
  set.add_prefix("---");
  set.add_prefix("-");
  ASSERT_EQ(set.prefixes().size(), 4u);
  EXPECT_EQ(set.prefixes().front(), "---");
  EXPECT_EQ(set.prefixes()[1], "--");
}

TEST(set_optset, deactivation_marker_in_name) {
  OptSet set;
  Uid uid = set.add("--/color=b");
  EXPECT_TRUE(set[uid].deactivatable());
  EXPECT_EQ(set[uid].hint(), "--color");
  EXPECT_EQ(set.find("--color"), std::optional<Uid>(uid));
}

TEST(set_optset, find_by_alias_and_type) {
  OptSet set;
  Uid i = set.add("-flag=i");
  Uid s = set.add("-flag;--flag-str=s");
  Uid b = set.add("-flag=b");
  EXPECT_EQ(set.find("-flag"), std::optional<Uid>(i));
  EXPECT_EQ(set.find("-flag=s"), std::optional<Uid>(s));
  EXPECT_EQ(set.find("-flag=b"), std::optional<Uid>(b));
  EXPECT_EQ(set.find("--flag-str"), std::optional<Uid>(s));
  EXPECT_EQ(set.find_all("-flag").size(), 3u);
  EXPECT_FALSE(set.find("--flag").has_value());
}

TEST(set_optset, defaults_and_reset) {
  OptSet set;
  Uid flag = set.add("--flag");
  Uid level = set.add(OptConfig::parse("--level=i").default_value(
      Value{std::int64_t{2}}));
  Uid name = set.add("--name=s");
  EXPECT_FALSE(set.find_val<bool>("--flag"));
  EXPECT_EQ(set.find_val<std::int64_t>("--level"), 2);
  EXPECT_THROW((void)set.find_val<std::string>("--name"), Error);

  set[flag].store().apply(Action::Set, Value{true});
  set[flag].set_matched(true);
  set[level].store().apply(Action::Set, Value{std::int64_t{5}});
  set.reset();
  EXPECT_FALSE(set[flag].matched());
  EXPECT_FALSE(set.find_val<bool>("--flag"));
  EXPECT_EQ(set.find_val<std::int64_t>("--level"), 2);
  EXPECT_TRUE(set[name].store().empty());
}

TEST(set_optset, wrong_type_throws) {
  OptSet set;
  set.add("--flag");
  try {
    (void)set.find_val<std::string>("--flag");
    FAIL() << "expected a type mismatch";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::ValueTypeMismatch);
  }
}

TEST(set_optset, invalid_uid) {
  OptSet set;
  try {
    (void)set[Uid{3}];
    FAIL() << "expected an invalid uid";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidUid);
  }
}

TEST(set_optset, positional_needs_index) {
  OptSet set;
  EXPECT_THROW(set.add("file=p"), Error);
  EXPECT_NO_THROW(set.add("file=p@*"));
  EXPECT_TRUE(static_cast<bool>(set.add("list=c")));
  EXPECT_TRUE(set.has_cmd());
}

TEST(set_optset, command_defaults) {
  OptSet set;
  Uid list = set.add("list=c");
  EXPECT_TRUE(set[list].force());
  EXPECT_EQ(set[list].index(), Index::forward(1));
  EXPECT_FALSE(set.find_val<bool>("list"));
}

#include "dopt/Parser.hpp"
#include <gtest/gtest.h>

using namespace dopt;

namespace {

void register_opts(Parser &parser) {
  parser.add_opt("--name=s");
  parser.add_opt(OptConfig::parse("-v").action(Action::Cnt));
  parser.add_opt(OptConfig::parse("file=p@1").value_type(ValueType::Str));
}

void expect_same_log(const ParseReturn &lhs, const ParseReturn &rhs) {
  ASSERT_EQ(lhs.bindings().size(), rhs.bindings().size());
  for (std::size_t i = 0; i < lhs.bindings().size(); ++i) {
    const Binding &l = lhs.bindings()[i];
    const Binding &r = rhs.bindings()[i];
    EXPECT_EQ(l.uid, r.uid) << "binding " << i;
    EXPECT_EQ(l.index, r.index) << "binding " << i;
    EXPECT_TRUE(l.value == r.value) << "binding " << i;
  }
}

} // namespace

TEST(policy_delay, same_values_as_forward) {
  const std::vector<std::string> args = {"app", "-v", "in.txt", "--name",
                                         "x",   "-v"};
  Parser fwd;
  Parser delay(PolicyKind::Delay);
  register_opts(fwd);
  register_opts(delay);
  ASSERT_TRUE(fwd.parse(args).ok());
  ASSERT_TRUE(delay.parse(args).ok());

  for (Parser *parser : {&fwd, &delay}) {
    EXPECT_EQ(parser->find_val<std::string>("--name"), "x");
    EXPECT_EQ(parser->find_val<std::uint64_t>("-v"), 2u);
    EXPECT_EQ(parser->find_val<std::string>("file"), "in.txt");
  }
}

TEST(policy_delay, options_run_after_positionals) {
  std::vector<std::string> order;
  auto record = [&](std::string what) {
    return [&order, what](OptSet &, InvokeCtx &ctx) -> std::optional<Value> {
      order.push_back(what);
      return ctx.value;
    };
  };

  Parser fwd;
  Parser delay(PolicyKind::Delay);
  for (Parser *parser : {&fwd, &delay}) {
    parser->add_opt("--name=s", record("name"));
    parser->add_opt("file=p@1", record("file"));
    parser->add_opt("main=m", record("main"));
  }

  ASSERT_TRUE(fwd.parse({"app", "--name=x", "in"}).ok());
  EXPECT_EQ(order, (std::vector<std::string>{"name", "file", "main"}));

  order.clear();
  ASSERT_TRUE(delay.parse({"app", "--name=x", "in"}).ok());
  EXPECT_EQ(order, (std::vector<std::string>{"file", "name", "main"}));
}

TEST(policy_delay, delayed_handler_sees_positional) {
  Parser parser(PolicyKind::Delay);
  Uid output = parser.add_opt("--output=s");
  parser.add_opt(OptConfig::parse("file=p@1").value_type(ValueType::Str));
  std::string seen;
  parser.on(output, [&](OptSet &set, InvokeCtx &ctx) -> std::optional<Value> {
    seen = set.find_val<std::string>("file");
    return ctx.value;
  });
  ASSERT_TRUE(parser.parse({"app", "--output=o", "in.txt"}).ok());
  EXPECT_EQ(seen, "in.txt");
}

TEST(policy_delay, no_delay_runs_during_scan) {
  std::vector<std::string> order;
  Parser parser(PolicyKind::Delay);
  Uid now = parser.add_opt(OptConfig::parse("--now").no_delay(true));
  Uid later = parser.add_opt("--later");
  Uid file = parser.add_opt(OptConfig::parse("file=p@1").value_type(ValueType::Str));
  for (auto [uid, name] : {std::pair{now, "now"}, std::pair{later, "later"},
                           std::pair{file, "file"}}) {
    parser.on(uid, [&order, label = std::string(name)](
                       OptSet &, InvokeCtx &ctx) -> std::optional<Value> {
      order.push_back(label);
      return ctx.value;
    });
  }
  ASSERT_TRUE(parser.parse({"app", "--later", "x", "--now"}).ok());
  EXPECT_EQ(order, (std::vector<std::string>{"now", "file", "later"}));
}

TEST(policy_delay, rejected_delayed_binding_is_undone) {
  Parser parser(PolicyKind::Delay);
  Uid level = parser.add_opt("--level=i");
  parser.on(level, [](OptSet &, InvokeCtx &ctx) -> std::optional<Value> {
    if (std::get<std::int64_t>(*ctx.value) > 10) {
      return std::nullopt;
    }
    return ctx.value;
  });
  auto ret = parser.parse({"app", "--level=99"});
  ASSERT_TRUE(ret.ok());
  EXPECT_FALSE(parser.optset()[level].matched());
  EXPECT_TRUE(ret.bindings().empty());
}

TEST(policy_delay, rejected_force_option_is_required) {
  Parser parser(PolicyKind::Delay);
  Uid level = parser.add_opt("--level=i!");
  parser.on(level, [](OptSet &, InvokeCtx &) -> std::optional<Value> {
    throw Error::failure("out of range");
  });
  auto ret = parser.parse({"app", "--level=99"});
  ASSERT_FALSE(ret.ok());
  EXPECT_EQ(ret.failure()->kind(), ErrorKind::OptionRequired);
  EXPECT_NE(ret.failure()->chain().find("out of range"), std::string::npos);
}

TEST(policy_delay, strict_still_rejects_unknown) {
  Parser parser(PolicyKind::Delay);
  parser.add_opt("--known");
  auto ret = parser.parse({"app", "--unknown"});
  ASSERT_FALSE(ret.ok());
  EXPECT_EQ(ret.failure()->kind(), ErrorKind::NotFound);
}

TEST(policy_delay, binding_log_matches_forward) {
  const std::vector<std::vector<std::string>> inputs = {
      {"app", "--name=x", "in"},
      {"app", "-v", "in", "--name", "y", "-v"},
      {"app", "in", "--", "-v"},
  };
  for (const auto &args : inputs) {
    Parser fwd;
    Parser delay(PolicyKind::Delay);
    for (Parser *parser : {&fwd, &delay}) {
      register_opts(*parser);
      parser->add_opt("main=m");
    }
    auto lhs = fwd.parse(args);
    auto rhs = delay.parse(args);
    ASSERT_TRUE(lhs.ok());
    ASSERT_TRUE(rhs.ok());
    expect_same_log(lhs, rhs);
    EXPECT_EQ(lhs.noa(), rhs.noa());
  }
}

TEST(policy_delay, rejecting_handler_matches_forward) {
  auto reject_large = [](OptSet &, InvokeCtx &ctx) -> std::optional<Value> {
    if (std::get<std::int64_t>(*ctx.value) > 10) {
      return std::nullopt;
    }
    return ctx.value;
  };
  const std::vector<std::vector<std::string>> inputs = {
      {"app", "--level=99", "--level=5", "in"},
      {"app", "--level=5", "--level", "99", "in", "--level=77"},
      {"app", "in", "--level=99"},
  };
  for (const auto &args : inputs) {
    Parser fwd;
    Parser delay(PolicyKind::Delay);
    for (Parser *parser : {&fwd, &delay}) {
      parser->add_opt("--level=i", reject_large);
      parser->add_opt(OptConfig::parse("file=p@1").value_type(ValueType::Str));
    }
    auto lhs = fwd.parse(args);
    auto rhs = delay.parse(args);
    ASSERT_TRUE(lhs.ok());
    ASSERT_TRUE(rhs.ok());
    expect_same_log(lhs, rhs);
    EXPECT_EQ(lhs.noa(), rhs.noa());
    EXPECT_EQ(fwd.find_val<std::string>("file"), "in");
    EXPECT_EQ(delay.find_val<std::string>("file"), "in");
    Uid level = *fwd.optset().find("--level");
    EXPECT_EQ(fwd.optset()[level].matched(), delay.optset()[level].matched());
  }
}

TEST(policy_delay, rejected_then_accepted_keeps_force_option_matched) {
  Parser parser(PolicyKind::Delay);
  Uid level = parser.add_opt("--level=i!");
  parser.on(level, [](OptSet &, InvokeCtx &ctx) -> std::optional<Value> {
    if (std::get<std::int64_t>(*ctx.value) > 10) {
      return std::nullopt;
    }
    return ctx.value;
  });

  auto ret = parser.parse({"app", "--level=99", "--level=5"});
  ASSERT_TRUE(ret.ok());
  EXPECT_TRUE(parser.optset()[level].matched());
  EXPECT_EQ(parser.find_val<std::int64_t>("--level"), 5);

  auto twice = parser.parse({"app", "--level=5", "--level=99", "--level=77"});
  ASSERT_TRUE(twice.ok());
  EXPECT_TRUE(parser.optset()[level].matched());
  EXPECT_EQ(parser.find_val<std::int64_t>("--level"), 5);
  EXPECT_EQ(twice.bindings().size(), 1u);

  auto none = parser.parse({"app", "--level=99", "--level=77"});
  ASSERT_FALSE(none.ok());
  EXPECT_EQ(none.failure()->kind(), ErrorKind::OptionRequired);
  EXPECT_FALSE(parser.optset()[level].matched());
}

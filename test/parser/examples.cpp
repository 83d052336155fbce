#include "dopt/dopt.hpp"
#include <gtest/gtest.h>

using namespace dopt;

TEST(parser_examples, short_and_long_booleans) {
  Parser parser;
  parser.add_opt("-f=b");
  parser.add_opt("--flag=b");
  ASSERT_TRUE(parser.parse({"app", "-f"}).ok());
  EXPECT_TRUE(parser.find_val<bool>("-f"));
  EXPECT_FALSE(parser.find_val<bool>("--flag"));
}

TEST(parser_examples, overloaded_option) {
  Parser parser;
  parser.set_overload(true);
  parser.add_opt("-flag=i");
  parser.add_opt("-flag=s");
  parser.add_opt("-flag=b");
  auto ret = parser.parse({"app", "-flag=foo", "-flag=42", "-flag"});
  ASSERT_TRUE(ret.ok());
  EXPECT_EQ(parser.find_val<std::int64_t>("-flag=i"), 42);
  EXPECT_EQ(parser.find_val<std::string>("-flag=s"), "foo");
  EXPECT_TRUE(parser.find_val<bool>("-flag=b"));
  EXPECT_EQ(ret.bindings().size(), 3u);
}

TEST(parser_examples, overload_disabled_tries_first_only) {
  Parser parser;
  parser.add_opt("-flag=i");
  parser.add_opt("-flag=s");
  auto ret = parser.parse({"app", "-flag=foo"});
  ASSERT_FALSE(ret.ok());
  EXPECT_EQ(ret.failure()->kind(), ErrorKind::InvalidValue);
}

TEST(parser_examples, command_with_positionals) {
  Parser parser;
  parser.add_opt("--foo=s");
  parser.add_opt("first=p@1");
  parser.add_opt(OptConfig::parse("second=p@2").value_type(ValueType::Str));
  parser.add_opt("list=c");
  auto ret = parser.parse({"app", "list", "--foo", "value", "bar"});
  ASSERT_TRUE(ret.ok());
  EXPECT_TRUE(parser.find_val<bool>("list"));
  EXPECT_TRUE(parser.find_val<bool>("first"));
  EXPECT_EQ(parser.find_val<std::string>("second"), "bar");
  EXPECT_EQ(parser.find_val<std::string>("--foo"), "value");
  EXPECT_EQ(ret.noa(), (std::vector<std::string>{"app", "list", "bar"}));
}

TEST(parser_examples, strict_unknown_option) {
  Parser parser;
  parser.add_opt("-a");
  parser.add_opt("-b");
  auto ret = parser.parse({"app", "--opt-a"});
  ASSERT_FALSE(ret.ok());
  EXPECT_EQ(ret.failure()->kind(), ErrorKind::NotFound);
  EXPECT_NE(ret.failure()->chain().find("--opt-a"), std::string::npos);
}

TEST(parser_examples, strict_unknown_option_with_empty_prefix) {
  Parser parser;
  parser.add_prefix("");
  parser.add_opt("a");
  parser.add_opt("b");
  auto ret = parser.parse({"app", "--opt-a"});
  ASSERT_FALSE(ret.ok());
  EXPECT_EQ(ret.failure()->kind(), ErrorKind::NotFound);
  EXPECT_NE(ret.failure()->chain().find("--opt-a"), std::string::npos);
}

TEST(parser_examples, aliases_and_help) {
  Parser parser;
  Uid verbose = parser.add_opt("--verbose;-V:print more");
  EXPECT_EQ(parser.optset()[verbose].help(), "print more");
  ASSERT_TRUE(parser.parse({"app", "-V"}).ok());
  EXPECT_TRUE(parser.find_val<bool>("--verbose"));
  EXPECT_EQ(parser.optset().find("-V"), std::optional<Uid>(verbose));
}

TEST(parser_examples, custom_value_parser) {
  Parser parser;
  parser.add_opt(OptConfig::parse("--mode=s").value_parser(
      [](std::string_view raw) -> std::optional<Value> {
        if (raw == "fast" || raw == "slow") {
          return Value{std::string(raw)};
        }
        return std::nullopt;
      }));
  ASSERT_TRUE(parser.parse({"app", "--mode=fast"}).ok());
  EXPECT_EQ(parser.find_val<std::string>("--mode"), "fast");

  auto bad = parser.parse({"app", "--mode=medium"});
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ(bad.failure()->kind(), ErrorKind::InvalidValue);
}

TEST(parser_examples, default_value_survives_unmatched) {
  Parser parser;
  parser.add_opt(OptConfig::parse("--jobs=u").default_value(Value{std::uint64_t{8}}));
  ASSERT_TRUE(parser.parse({"app"}).ok());
  EXPECT_EQ(parser.find_val<std::uint64_t>("--jobs"), 8u);
  ASSERT_TRUE(parser.parse({"app", "--jobs", "2"}).ok());
  EXPECT_EQ(parser.find_val<std::uint64_t>("--jobs"), 2u);
}

TEST(parser_examples, handler_can_transform_value) {
  Parser parser;
  parser.add_opt("--name=s", [](OptSet &, InvokeCtx &ctx) -> std::optional<Value> {
    return Value{fmt::format("<{}>", std::get<std::string>(*ctx.value))};
  });
  ASSERT_TRUE(parser.parse({"app", "--name=x"}).ok());
  EXPECT_EQ(parser.find_val<std::string>("--name"), "<x>");
}

TEST(parser_examples, value_lookup_errors) {
  Parser parser;
  parser.add_opt("--name=s");
  ASSERT_TRUE(parser.parse({"app"}).ok());
  EXPECT_THROW(parser.find_val<std::string>("--name"), Error);
  EXPECT_THROW(parser.find_val<std::string>("--missing"), Error);
  ASSERT_TRUE(parser.parse({"app", "--name=x"}).ok());
  EXPECT_THROW(parser.find_val<bool>("--name"), Error);
}

TEST(parser_examples, invalid_create_strings_throw) {
  Parser parser;
  EXPECT_THROW(parser.add_opt("--x=q"), Error);
  EXPECT_THROW(parser.add_opt("pos=p"), Error);
  EXPECT_THROW(parser.add_opt("--x@1..1"), Error);
  EXPECT_THROW(parser.on(Uid{99}, nullptr), Error);
}

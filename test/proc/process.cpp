#include "dopt/diag/FailManager.hpp"
#include "dopt/lex/split.hpp"
#include "dopt/policy/guess.hpp"
#include "dopt/proc/Process.hpp"
#include "dopt/set/OptSet.hpp"
#include <gtest/gtest.h>

using namespace dopt;

namespace {

OptProcess guess(const OptSet &set, Style style, std::string_view raw,
                 std::optional<std::string_view> next = std::nullopt) {
  lex::Token tok = lex::split(raw, set.prefixes());
  auto proc = policy::guess_opt(style, tok, next, set);
  if (!proc) {
    throw std::runtime_error("style does not apply");
  }
  return std::move(*proc);
}

bool run(OptSet &set, OptProcess &proc, bool overload,
         diag::FailManager &fails) {
  for (Opt &opt : set) {
    if (proc.quit()) {
      break;
    }
    proc.process(opt, overload, fails);
  }
  return proc.is_matched();
}

} // namespace

TEST(proc_process, combined_is_all_or_nothing) {
  OptSet set;
  Uid a = set.add("-a");
  Uid b = set.add("-b");
  set.add("-d");
  diag::FailManager fails;

  OptProcess proc = guess(set, Style::CombinedOption, "-abc");
  EXPECT_EQ(proc.mode(), OptProcess::Mode::All);
  ASSERT_EQ(proc.matches().size(), 3u);
  EXPECT_FALSE(run(set, proc, false, fails));
  EXPECT_FALSE(proc.quit());

  proc.undo(set);
  EXPECT_FALSE(set[a].matched());
  EXPECT_FALSE(set[b].matched());
  EXPECT_TRUE(fails.empty());
}

TEST(proc_process, combined_binds_every_letter) {
  OptSet set;
  Uid a = set.add("-a");
  Uid b = set.add("-b");
  Uid c = set.add("-c");
  diag::FailManager fails;

  OptProcess proc = guess(set, Style::CombinedOption, "-cab");
  ASSERT_TRUE(run(set, proc, false, fails));
  EXPECT_TRUE(set[a].matched());
  EXPECT_TRUE(set[b].matched());
  EXPECT_TRUE(set[c].matched());
  EXPECT_EQ(proc.matches()[0].uid(), std::optional<Uid>(c));
}

TEST(proc_process, combined_offers_option_to_every_letter) {
  OptSet set;
  Uid a = set.add("-a");
  Uid b = set.add("-b");
  diag::FailManager fails;

  OptProcess proc = guess(set, Style::CombinedOption, "-aba");
  ASSERT_TRUE(run(set, proc, false, fails));
  EXPECT_EQ(proc.matches()[0].uid(), std::optional<Uid>(a));
  EXPECT_EQ(proc.matches()[1].uid(), std::optional<Uid>(b));
  EXPECT_EQ(proc.matches()[2].uid(), std::optional<Uid>(a));

  proc.undo(set);
  EXPECT_FALSE(set[a].matched());
  EXPECT_FALSE(set[b].matched());
}

TEST(proc_process, process_returns_first_bound_index) {
  OptSet set;
  Uid v = set.add("-v");
  diag::FailManager fails;

  OptProcess proc = guess(set, Style::CombinedOption, "-vv");
  EXPECT_EQ(proc.process(set[v], false, fails), std::optional<std::size_t>(0));
  EXPECT_TRUE(proc.is_matched());

  OptProcess single = guess(set, Style::Boolean, "-v");
  EXPECT_EQ(single.process(set[v], false, fails),
            std::optional<std::size_t>(0));
  EXPECT_TRUE(single.is_matched());
}

TEST(proc_process, embedded_value_splits_first_char) {
  OptSet set;
  Uid i = set.add("-i=i");
  diag::FailManager fails;
  OptProcess proc = guess(set, Style::EmbeddedValue, "-i42");
  ASSERT_TRUE(run(set, proc, false, fails));
  EXPECT_EQ(proc.matches()[0].uid(), std::optional<Uid>(i));
  EXPECT_EQ(std::get<std::int64_t>(*proc.matches()[0].value()), 42);
}

TEST(proc_process, embedded_plus_any_split) {
  OptSet set;
  Uid opt = set.add("--opt=i");
  diag::FailManager fails;
  OptProcess proc = guess(set, Style::EmbeddedValuePlus, "--opt42");
  EXPECT_EQ(proc.mode(), OptProcess::Mode::Any);
  ASSERT_EQ(proc.matches().size(), 3u);
  ASSERT_TRUE(run(set, proc, false, fails));
  EXPECT_TRUE(proc.quit());
  EXPECT_FALSE(proc.matches()[0].is_matched());
  ASSERT_TRUE(proc.matches()[1].is_matched());
  EXPECT_EQ(proc.matches()[1].uid(), std::optional<Uid>(opt));
  EXPECT_EQ(std::get<std::int64_t>(*proc.matches()[1].value()), 42);
}

TEST(proc_process, argument_consumes_next) {
  OptSet set;
  set.add("--name=s");
  diag::FailManager fails;
  OptProcess with_next = guess(set, Style::Argument, "--name", "bob");
  EXPECT_TRUE(with_next.consume());
  ASSERT_TRUE(run(set, with_next, false, fails));
  EXPECT_EQ(std::get<std::string>(*with_next.matches()[0].value()), "bob");

  OptProcess last = guess(set, Style::Argument, "--name");
  EXPECT_FALSE(last.consume());
  EXPECT_FALSE(run(set, last, false, fails));
  ASSERT_EQ(fails.size(), 1u);
  EXPECT_EQ(fails.failures()[0].kind(), ErrorKind::MissingValue);
}

TEST(proc_process, value_failures_are_recorded) {
  OptSet set;
  set.add("-flag=i");
  Uid s = set.add("-flag=s");
  diag::FailManager fails;
  OptProcess proc = guess(set, Style::EqualWithValue, "-flag=foo");
  ASSERT_TRUE(run(set, proc, true, fails));
  EXPECT_EQ(proc.matches()[0].uid(), std::optional<Uid>(s));
  ASSERT_EQ(fails.size(), 1u);
  EXPECT_EQ(fails.failures()[0].kind(), ErrorKind::InvalidValue);
}

TEST(proc_process, styles_without_shape) {
  OptSet set;
  lex::Token tok = lex::split("--opt=1", set.prefixes());
  EXPECT_FALSE(policy::guess_opt(Style::Boolean, tok, std::nullopt, set));
  EXPECT_FALSE(policy::guess_opt(Style::Argument, tok, std::nullopt, set));
  EXPECT_TRUE(policy::guess_opt(Style::EqualWithValue, tok, std::nullopt, set));
  lex::Token single = lex::split("-a", set.prefixes());
  EXPECT_FALSE(
      policy::guess_opt(Style::CombinedOption, single, std::nullopt, set));
  EXPECT_FALSE(
      policy::guess_opt(Style::EmbeddedValue, single, std::nullopt, set));
}

TEST(proc_process, undo_of_unmatched_process_is_noop) {
  OptSet set;
  Uid a = set.add("-a");
  set[a].set_matched(true);
  OptProcess proc = guess(set, Style::CombinedOption, "-ab");
  proc.undo(set);
  proc.undo(set);
  EXPECT_TRUE(set[a].matched());
}

TEST(proc_process, noa_first_fit) {
  OptSet set;
  Uid first = set.add(OptConfig::parse("first=p@*").value_type(ValueType::Str));
  set.add(OptConfig::parse("other=p@*").value_type(ValueType::Str));
  diag::FailManager fails;
  NoaProcess proc = policy::guess_noa(Style::Pos, "x", 1, 2, set);
  for (Opt &opt : set) {
    if (proc.quit()) {
      break;
    }
    proc.process(opt, set.pool().find(""), fails);
  }
  ASSERT_TRUE(proc.is_matched());
  EXPECT_EQ(proc.match().uid(), std::optional<Uid>(first));
}

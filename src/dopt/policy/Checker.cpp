#include "dopt/policy/Checker.hpp"
#include "dopt/set/OptSet.hpp"
#include <fmt/ranges.h>

namespace dopt::policy {

namespace {

struct Invalid {
  std::vector<std::string> names;
  std::optional<Uid> first;
};

std::string join_names(const std::vector<std::string> &names) {
  return fmt::format("{}", fmt::join(names, "`, `"));
}

Invalid collect_invalid(const OptSet &set, OptKind kind) {
  Invalid out;
  for (const Opt &opt : set) {
    if (opt.kind() == kind && !opt.valid()) {
      out.names.push_back(opt.hint());
      if (!out.first) {
        out.first = opt.uid();
      }
    }
  }
  return out;
}

} // namespace

void pre_check(const OptSet &set) {
  if (!set.has_cmd()) {
    return;
  }
  for (const Opt &opt : set) {
    if (opt.kind() == OptKind::Pos && opt.force() &&
        opt.index() == Index::forward(1)) {
      throw Error::unexpected_pos_if_has_cmd(opt.uid());
    }
  }
}

void opt_check(const OptSet &set, const diag::FailManager &fails) {
  Invalid invalid = collect_invalid(set, OptKind::Option);
  if (invalid.names.empty()) {
    return;
  }
  Error err = Error::option_required(join_names(invalid.names));
  err.with_uid(*invalid.first);
  throw fails.cause_uid(std::move(err));
}

void cmd_check(const OptSet &set, const diag::FailManager &fails) {
  std::vector<std::string> names;
  bool any_valid = false;
  for (const Opt &opt : set) {
    if (opt.kind() != OptKind::Cmd) {
      continue;
    }
    names.push_back(opt.hint());
    any_valid = any_valid || opt.valid();
  }
  if (names.empty() || any_valid) {
    return;
  }
  throw fails.cause(Error::cmd_required(join_names(names)));
}

void pos_check(const OptSet &set, const diag::FailManager &fails) {
  Invalid invalid = collect_invalid(set, OptKind::Pos);
  if (invalid.names.empty()) {
    return;
  }
  Error err = Error::pos_required(join_names(invalid.names));
  err.with_uid(*invalid.first);
  throw fails.cause_uid(std::move(err));
}

void post_check(const OptSet &set, const diag::FailManager &fails) {
  Invalid invalid = collect_invalid(set, OptKind::Main);
  if (invalid.names.empty()) {
    return;
  }
  Error err = Error::option_required(join_names(invalid.names));
  err.with_uid(*invalid.first);
  throw fails.cause_uid(std::move(err));
}

} // namespace dopt::policy

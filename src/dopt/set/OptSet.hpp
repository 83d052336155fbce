#pragma once

#include "dopt/memory/StringPool.hpp"
#include "dopt/opt/Opt.hpp"
#include "dopt/opt/OptConfig.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dopt {

// Owns every option of one parser, indexed by uid in registration
// order, together with the prefixes and the interned names.
class OptSet {
public:
  OptSet();

  OptSet(const OptSet &) = delete;
  OptSet &operator=(const OptSet &) = delete;
  OptSet(OptSet &&) = default;
  OptSet &operator=(OptSet &&) = default;

  Uid add(const OptConfig &cfg);
  Uid add(std::string_view create) { return add(OptConfig::parse(create)); }

  // Prefixes are kept longest first. Options added before a prefix was
  // registered keep their resolved names.
  void add_prefix(std::string prefix);
  const std::vector<std::string> &prefixes() const noexcept {
    return m_prefixes;
  }

  std::size_t size() const noexcept { return m_opts.size(); }
  bool empty() const noexcept { return m_opts.empty(); }

  Opt &operator[](Uid uid);
  const Opt &operator[](Uid uid) const;

  auto begin() noexcept { return m_opts.begin(); }
  auto end() noexcept { return m_opts.end(); }
  auto begin() const noexcept { return m_opts.begin(); }
  auto end() const noexcept { return m_opts.end(); }

  memory::StringPool &pool() noexcept { return m_pool; }
  const memory::StringPool &pool() const noexcept { return m_pool; }

  // `name` may carry a prefix and a "=type" suffix to pick one
  // overload, e.g. "-flag=i".
  std::optional<Uid> find(std::string_view name) const;
  std::vector<Uid> find_all(std::string_view name) const;

  Uid find_uid(std::string_view name) const;

  template <typename T> const T &find_val(std::string_view name) const {
    return (*this)[find_uid(name)].template val<T>();
  }

  template <typename T>
  std::vector<T> find_vals(std::string_view name) const {
    return (*this)[find_uid(name)].template vals<T>();
  }

  bool has_cmd() const;

  void reset();

  std::string_view str(memory::Symbol sym) const { return m_pool.str(sym); }

private:
  struct SplitName {
    std::string prefix;
    std::string name;
    bool deactivatable = false;
  };

  SplitName split_name(std::string_view raw) const;

  std::vector<Opt> m_opts;
  std::vector<std::string> m_prefixes;
  memory::StringPool m_pool;
};

} // namespace dopt

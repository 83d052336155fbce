#pragma once

#include "dopt/opt/StyleCatalog.hpp"

namespace dopt {

struct PolicySettings {
  // Unknown prefixed tokens fail the parse instead of becoming NOAs.
  bool strict = true;
  // Try every option sharing a name until one accepts the value.
  bool overload = false;
  // A bare "--" ends option matching.
  bool end_of_options = true;
  StyleCatalog styles;
};

} // namespace dopt

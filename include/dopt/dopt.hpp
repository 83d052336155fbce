#pragma once

#include "dopt/Parser.hpp"
#include "dopt/diag/Error.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/lex/split.hpp"
#include "dopt/opt/Index.hpp"
#include "dopt/opt/OptConfig.hpp"
#include "dopt/opt/StyleCatalog.hpp"
#include "dopt/opt/Value.hpp"
#include "dopt/policy/InvokeCtx.hpp"
#include "dopt/policy/ParseReturn.hpp"
#include "dopt/set/OptSet.hpp"

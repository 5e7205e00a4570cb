#pragma once

#include "scour/config.hpp"
#include "scour/ecosystem.hpp"
#include "scour/format.hpp"
#include "scour/invocation.hpp"
#include "scour/probe.hpp"
#include "scour/report.hpp"
#include "scour/session.hpp"
#include "scour/summary.hpp"
#include "scour/tools.hpp"
#include "scour/utils.hpp"

namespace scour {
    inline constexpr auto version = "0.1.0"sv;
}  // namespace scour

#pragma once

// -----------------------------------------------------------------------------
// Wireload - WebSocket subscription-filter load generator
//
// Single include for applications embedding the engine.
// -----------------------------------------------------------------------------

#include "wireload/core/config/error.hpp"
#include "wireload/core/config/run.hpp"
#include "wireload/core/config/scenario.hpp"
#include "wireload/core/metrics/summary.hpp"
#include "wireload/core/runner.hpp"
#include "lcr/log/logger.hpp"

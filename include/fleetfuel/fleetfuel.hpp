#pragma once

/// Convenience umbrella header for the fleetfuel library.

#include <fleetfuel/core/column.hpp>
#include <fleetfuel/core/sample.hpp>
#include <fleetfuel/core/table.hpp>
#include <fleetfuel/core/time.hpp>
#include <fleetfuel/core/units.hpp>
#include <fleetfuel/io/cells.hpp>
#include <fleetfuel/io/print.hpp>
#include <fleetfuel/io/store.hpp>
#include <fleetfuel/pipeline/aggregator.hpp>
#include <fleetfuel/pipeline/aligner.hpp>
#include <fleetfuel/pipeline/error.hpp>
#include <fleetfuel/pipeline/fuel_model.hpp>
#include <fleetfuel/pipeline/imputer.hpp>
#include <fleetfuel/pipeline/integrator.hpp>

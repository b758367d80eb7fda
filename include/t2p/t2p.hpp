/**
 * @file t2p.hpp
 * @brief Texture2Par data preparation
 *
 * Prepares well-log lithology data and control files for the Texture2Par
 * interpolator:
 * - Raw well-log tables reconciled into a canonical dataset
 * - Datasets merged across batches with globally unique well IDs
 * - Control files written literally or as PEST templates
 *
 * Example usage:
 * @code
 * auto schema = DatasetSchema::dataset({"PC"});
 * Dataset dataset(schema, stderr_status());
 *
 * ReconcileOptions options;
 * options.depth_top_col = "Top";
 * dataset.add_wells(RawTable::from_file("wells.csv"), options);
 * dataset.write("dataset.dat");
 *
 * InputFileSettings settings;
 * settings.well_log_file = "dataset.dat";
 * settings.unit_file = "hsu.dat";
 * settings.sim_file = "model.nam";
 * InputFile input(settings);
 * input.add_pilot_point(Vec2(1000.0, 2000.0), {1.0, 5.0, 0.01, 0.1}, {1e-5, 1e-5, 0.1, 0.05});
 * input.select_pilot_point_parameters({"KCMin"});
 * input.write("Texture2Par.in");
 * input.write("Texture2Par.tpl", {true, '$'});
 * @endcode
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/parameters.hpp"
#include "core/config.hpp"

// I/O includes
#include "io/format.hpp"
#include "io/raw_table.hpp"

// Well-log includes
#include "wells/schema.hpp"
#include "wells/reconciler.hpp"
#include "wells/dataset.hpp"

// Control file includes
#include "control/pilot_point.hpp"
#include "control/template_writer.hpp"
#include "control/input_file.hpp"

namespace t2p {

/// Library version
inline constexpr const char* VERSION = "0.1.0";

} // namespace t2p

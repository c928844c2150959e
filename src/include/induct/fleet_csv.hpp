/*───────────────────────────────────────────────────────────
 *  fleet_csv.hpp   –  header-led CSV → TrainRecord rows
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <istream>
#include <string>
#include <vector>

#include "induct/train_record.hpp"

namespace induct {

/* InputError: no header, no train_id column, or no data rows.
   Unknown columns are ignored, unparsable cells become absent. */
std::vector<TrainRecord> read_fleet_csv(std::istream& in);
std::vector<TrainRecord> load_fleet_csv(const std::string& path);

} // namespace induct

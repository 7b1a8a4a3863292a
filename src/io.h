// io.h
#pragma once
#include <filesystem>
#include <vector>
#include <string>

#include "utilities.h"  // NDArray, Tally, etc.
#include "garage.h"     // Garage, filled by parsing

struct SimulationState;
class  XiStepper;
class  Diagnostics;

// Parse the sectioned input file into `g`. Reports problems on stderr and
// returns false; unknown keys are warned about and skipped.
bool parse_input_file(const std::filesystem::path& path, Garage& g);

// Range and consistency checks. Throws ConfigurationError naming the key.
void validate_settings(const Garage& g);

// Create (truncate) the output file with an empty /snapshots group.
bool create_output(const std::filesystem::path& out);

// Append /snapshots/slice_<xi_index> to an output file made by create_output().
bool write_snapshot(const std::filesystem::path& out, const SimulationState& s);

// Write /input, /details and /diagnostics into the output file.
bool write_output(const std::filesystem::path& out, const XiStepper& stepper,
                  const Diagnostics& diags, double sim_s, double total_s);

// Full SimulationState, enough to continue the run bit for bit.
bool write_checkpoint(const std::filesystem::path& path, const SimulationState& s);
bool read_checkpoint(const std::filesystem::path& path, SimulationState& s);

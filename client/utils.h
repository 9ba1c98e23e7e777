#pragma once

#include "StepSummary.hpp"
#include <string>

/**
 * @brief Appends one step summary to a JSON array file.
 *
 * A missing, empty or non-array file is replaced by a single-element array.
 */
void append_step_summary_to_file(const StepSummary& s, const std::string& path);

// UTC time formatted as 2024-05-01_13-45-10-123, safe for file names.
std::string file_timestamp();

// ==============================================================================
// Layer 1: DSP Primitive - Matched-Filter Template Loader
// ==============================================================================
// Reads a 1-D template from delimited text (CSV, semicolon or whitespace).
//
// Column choice: a header row naming a column "y" selects that column,
// otherwise the last column of each row is used. Lines starting with '#' and
// rows whose selected field is not numeric are skipped.
// ==============================================================================

#pragma once

#include <istream>
#include <string>
#include <vector>

namespace Scopelab::DSP {

/// @brief Parse template samples from a text stream.
/// @throws AnalysisError (EmptyTemplate) if no numeric sample is found
[[nodiscard]] std::vector<float> parseTemplate(std::istream& input);

/// @brief Load template samples from a file.
/// @throws AnalysisError (TemplateNotFound) for an empty, missing or unreadable path
/// @throws AnalysisError (EmptyTemplate) if the file holds no numeric sample
[[nodiscard]] std::vector<float> loadTemplate(const std::string& path);

} // namespace Scopelab::DSP

#pragma once

#include <chrono>
#include <filesystem>

#include "types.hpp"

namespace cohanon {

struct ConvertOptions {
  // Kill the converter after this long; zero waits forever
  std::chrono::milliseconds timeout{0};
};

// Run the external coh3-to-EDF converter as
//   <executable> <input> <output>
// and wait for it.
//
// The converter's output is opaque and never read back. Its stdout and stderr
// are captured into Error::diagnostics. A missing executable, a launch
// failure, a non-zero exit status, a fatal signal or a timeout are all
// reported as ConversionFailed.
bool convert(const std::filesystem::path &executable, const std::filesystem::path &input,
             const std::filesystem::path &output, const ConvertOptions &options = {},
             Error *outError = nullptr);

// Default converter output: `input` with its extension replaced by ".EDF"
std::filesystem::path convertedPath(const std::filesystem::path &input);

} // namespace cohanon

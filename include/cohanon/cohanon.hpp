#pragma once

// cohanon
// A C++20 library for anonymising Deltamed Coherence (coh3) .eeg recordings.
// The patient fields of the fixed-size header are blanked or rewritten in
// place; every other byte of the recording is copied verbatim.

#include "anonymiser.hpp"
#include "batch.hpp"
#include "converter.hpp"
#include "header.hpp"
#include "redaction.hpp"
#include "types.hpp"
#include "walker.hpp"

// The library provides three levels of abstraction:
//
// 1. Field codec: readHeader / writeField
//    - Raw access to the fixed-width slots of a header buffer
//
// 2. Single file: anonymise
//    - Resolves a RedactionRequest against the destination and writes the result
//
// 3. Batch: planTasks / runBatch
//    - Mirrors a source tree onto a destination root on a worker pool,
//      optionally running the external EDF converter on each output
//
// Example usage:
//
//   // One file
//   cohanon::RedactionRequest request;
//   request.setRedactAll(true).setDeriveNameFromFolder(true);
//
//   cohanon::Error error;
//   if (!cohanon::anonymise("in/P01/rec.eeg", "out/P01/rec.eeg", request, &error)) {
//     std::cerr << cohanon::toString(error.kind) << ": " << error.message << std::endl;
//   }
//
//   // A whole tree
//   cohanon::BatchOptions options;
//   options.sourceRoot = "dataset";
//   options.destinationRoot = "dataset_anonym";
//   options.request = request;
//   auto tasks = cohanon::planTasks(options, &error);
//   if (tasks) {
//     auto report = cohanon::runBatch(*tasks, options);
//   }

namespace cohanon {}

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "converter.hpp"
#include "redaction.hpp"
#include "types.hpp"

namespace cohanon {

// One recording to process
struct FileTask {
  std::filesystem::path source;
  std::filesystem::path destination;
  std::optional<std::filesystem::path> converted; // EDF output, if conversion is enabled
};

struct TaskResult {
  FileTask task;
  bool started = false;           // False if the batch was cancelled first
  bool anonymised = false;
  bool converted = false;
  bool conversionSkipped = false; // EDF output already existed
  Error error;

  bool ok() const { return started && !error; }
};

// Resolved parameters of one batch run
struct BatchOptions {
  std::filesystem::path sourceRoot;
  std::filesystem::path destinationRoot; // Empty: anonymise in place
  std::string extension = ".eeg";
  RedactionRequest request;

  std::filesystem::path converter; // Empty: no conversion
  ConvertOptions convertOptions;
  bool overwriteConverted = false;
  bool convertOnly = false;            // Convert the source files without anonymising them
  std::filesystem::path convertedRoot; // Empty: EDF output goes beside the converter input

  unsigned jobs = 1; // Worker threads; 0 uses the hardware concurrency
};

// Shared stop flag, checked before each task is started
class CancellationToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> cancelled_{false};
};

// Called after each task, serialised across workers.
// `completed` counts finished tasks, including the one reported.
using ProgressCallback =
    std::function<void(size_t completed, size_t total, const TaskResult &result)>;

struct BatchReport {
  std::vector<TaskResult> results; // Same order as the tasks
  size_t succeeded = 0;
  size_t failed = 0;
  size_t notStarted = 0;

  bool allSucceeded() const { return failed == 0 && notStarted == 0; }
};

// Walk the source root and build one task per recording, in walk order.
// Destinations mirror the source tree onto the destination root. In
// convert-only mode the destination is the source itself, and the EDF outputs
// mirror the source tree onto `convertedRoot` when one is given.
std::optional<std::vector<FileTask>> planTasks(const BatchOptions &options,
                                               Error *outError = nullptr);

// Anonymise one task, then convert it if requested.
// A failed anonymisation skips the conversion. In convert-only mode the
// destination is handed to the converter as is.
TaskResult runTask(const FileTask &task, const BatchOptions &options);

// Run every task on a bounded worker pool.
// Per-file failures are recorded and the batch carries on. Cancellation stops
// new tasks from starting; tasks already running finish.
BatchReport runBatch(const std::vector<FileTask> &tasks, const BatchOptions &options,
                     const CancellationToken *token = nullptr,
                     const ProgressCallback &progress = {});

} // namespace cohanon

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <cohanon/anonymiser.hpp>
#include <cohanon/batch.hpp>
#include <cohanon/walker.hpp>

namespace cohanon {

std::optional<std::vector<FileTask>> planTasks(const BatchOptions &options, Error *outError) {
  if (options.convertOnly && options.converter.empty()) {
    if (outError) {
      outError->kind = ErrorKind::ConversionFailed;
      outError->path = options.sourceRoot;
      outError->message = "Convert-only mode needs a converter executable";
    }
    return std::nullopt;
  }

  auto files = listFiles(options.sourceRoot, options.extension, outError);
  if (!files) {
    return std::nullopt;
  }

  const bool inPlace =
      options.convertOnly || isInPlace(options.sourceRoot, options.destinationRoot);

  std::vector<FileTask> tasks;
  tasks.reserve(files->size());
  for (auto &file : *files) {
    FileTask task;
    task.destination =
        inPlace ? file : mirrorPath(file, options.sourceRoot, options.destinationRoot);
    if (!options.converter.empty()) {
      task.converted = convertedPath(
          options.convertedRoot.empty()
              ? task.destination
              : mirrorPath(file, options.sourceRoot, options.convertedRoot));
    }
    task.source = std::move(file);
    tasks.push_back(std::move(task));
  }
  return tasks;
}

TaskResult runTask(const FileTask &task, const BatchOptions &options) {
  TaskResult result;
  result.task = task;
  result.started = true;

  if (!options.convertOnly) {
    if (!anonymise(task.source, task.destination, options.request, &result.error)) {
      return result;
    }
    result.anonymised = true;
  }

  if (!task.converted || options.converter.empty()) {
    return result;
  }

  std::error_code ec;
  if (!options.overwriteConverted && std::filesystem::exists(*task.converted, ec)) {
    result.conversionSkipped = true;
    return result;
  }

  auto parent = task.converted->parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      result.error.kind = ErrorKind::DestinationWrite;
      result.error.path = *task.converted;
      result.error.message =
          std::format("Failed to create directory {}: {}", parent.string(), ec.message());
      return result;
    }
  }

  result.converted = convert(options.converter, task.destination, *task.converted,
                             options.convertOptions, &result.error);
  return result;
}

BatchReport runBatch(const std::vector<FileTask> &tasks, const BatchOptions &options,
                     const CancellationToken *token, const ProgressCallback &progress) {
  BatchReport report;
  report.results.resize(tasks.size());
  for (size_t i = 0; i < tasks.size(); ++i) {
    report.results[i].task = tasks[i];
  }

  unsigned workers = options.jobs;
  if (workers == 0) {
    workers = std::max(1u, std::thread::hardware_concurrency());
  }
  workers = static_cast<unsigned>(std::min<size_t>(workers, tasks.size()));

  std::atomic<size_t> nextTask{0};
  size_t completed = 0;
  std::mutex progressMutex;

  auto worker = [&] {
    while (!(token && token->cancelled())) {
      const size_t index = nextTask.fetch_add(1);
      if (index >= tasks.size()) {
        break;
      }

      report.results[index] = runTask(tasks[index], options);

      // Counted under the lock so callbacks see `completed` strictly increase
      std::lock_guard<std::mutex> lock(progressMutex);
      ++completed;
      if (progress) {
        progress(completed, tasks.size(), report.results[index]);
      }
    }
  };

  if (workers <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
    for (auto &thread : pool) {
      thread.join();
    }
  }

  for (const auto &result : report.results) {
    if (!result.started) {
      ++report.notStarted;
    } else if (result.ok()) {
      ++report.succeeded;
    } else {
      ++report.failed;
    }
  }
  return report;
}

} // namespace cohanon

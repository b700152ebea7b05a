#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <cohanon/cohanon.hpp>

namespace {

cohanon::CancellationToken cancellation;

void onInterrupt(int) {
  cancellation.cancel();
}

void printUsage(const char *program) {
  std::cerr << "Usage: " << program << " <source_root> [options]\n"
            << "  -d, --destination <dir>  write the anonymised tree here (default: in place)\n"
            << "  --redact-all             blank every field not set otherwise\n"
            << "  --name, --surname, --birthdate, --sex, --folder, --centre, --comment\n"
            << "                           blank that field\n"
            << "  --folder-as-name         fill the name field with the parent folder name\n"
            << "  --convert <exe>          run the EDF converter on each anonymised file\n"
            << "  --timeout <seconds>      converter timeout (default: none)\n"
            << "  --overwrite              convert again when the .EDF file exists\n"
            << "  --convert-only           convert the source files without anonymising them\n"
            << "  --edf-destination <dir>  write the .EDF files here (default: beside the input)\n"
            << "  -j, --jobs <n>           worker threads (0: one per core)\n"
            << "  -v, --verbose            print the header fields of each output\n"
            << "  -y, --yes                start without asking\n";
}

unsigned long parseCount(const std::string &option, const char *text) {
  char *end = nullptr;
  unsigned long count = std::strtoul(text, &end, 10);
  if (end == text || *end != '\0') {
    std::cerr << "Error: " << option << " expects a number, got \"" << text << "\"\n";
    std::exit(1);
  }
  return count;
}

void printFields(const char *label, const std::filesystem::path &path) {
  cohanon::Error error;
  auto header = cohanon::inspect(path, &error);
  if (!header) {
    std::cerr << "  " << label << " unreadable: " << error.message << "\n";
    return;
  }
  std::cout << "  " << label << "\n";
  for (const auto &spec : cohanon::fieldTable) {
    std::cout << "    " << spec.name << ": \"" << header->text(spec.field) << "\"\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  cohanon::BatchOptions options;
  cohanon::RedactionToggles toggles;
  bool verbose = false;
  bool assumeYes = false;

  options.sourceRoot = argv[1];

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> const char * {
      if (i + 1 >= argc) {
        std::cerr << "Error: missing value for " << arg << "\n";
        std::exit(1);
      }
      return argv[++i];
    };

    if (arg == "-d" || arg == "--destination") {
      options.destinationRoot = value();
    } else if (arg == "--redact-all") {
      toggles.redactAll = true;
    } else if (arg == "--name") {
      toggles.name = true;
    } else if (arg == "--surname") {
      toggles.surname = true;
    } else if (arg == "--birthdate") {
      toggles.birthdate = true;
    } else if (arg == "--sex") {
      toggles.sex = true;
    } else if (arg == "--folder") {
      toggles.folder = true;
    } else if (arg == "--centre") {
      toggles.centre = true;
    } else if (arg == "--comment") {
      toggles.comment = true;
    } else if (arg == "--folder-as-name") {
      toggles.deriveNameFromFolder = true;
    } else if (arg == "--convert") {
      options.converter = value();
    } else if (arg == "--timeout") {
      options.convertOptions.timeout = std::chrono::seconds(parseCount(arg, value()));
    } else if (arg == "--overwrite") {
      options.overwriteConverted = true;
    } else if (arg == "--convert-only") {
      options.convertOnly = true;
    } else if (arg == "--edf-destination") {
      options.convertedRoot = value();
    } else if (arg == "-j" || arg == "--jobs") {
      options.jobs = static_cast<unsigned>(parseCount(arg, value()));
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "-y" || arg == "--yes") {
      assumeYes = true;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  options.request = cohanon::RedactionRequest::fromToggles(toggles);

  if (options.convertOnly && options.converter.empty()) {
    std::cerr << "Error: --convert-only needs --convert <exe>\n";
    return 1;
  }

  const bool inPlace =
      !options.convertOnly && cohanon::isInPlace(options.sourceRoot, options.destinationRoot);

  std::cout << "Source: " << options.sourceRoot.string() << "\n";
  if (!options.convertOnly) {
    std::cout << "Destination: "
              << (inPlace ? std::string("(in place)") : options.destinationRoot.string()) << "\n"
              << "Redact all: " << (toggles.redactAll ? "yes" : "no") << "\n"
              << "Folder as name: " << (toggles.deriveNameFromFolder ? "yes" : "no") << "\n";
    for (const auto &spec : cohanon::fieldTable) {
      const auto &action = options.request.explicitAction(spec.field);
      std::cout << "  " << spec.name << ": " << (action ? "blank" : "default") << "\n";
    }
  }
  if (!options.converter.empty()) {
    std::cout << "Converter: " << options.converter.string() << "\n"
              << "EDF destination: "
              << (options.convertedRoot.empty() ? std::string("(beside each input)")
                                                : options.convertedRoot.string())
              << "\n";
  }

  if (options.convertOnly) {
    std::cout << "Convert only: the recordings are not anonymised\n";
  } else if (options.request.isPassThrough()) {
    std::cerr << "Warning: no field is selected, the recordings will be copied unchanged\n";
  }

  if (inPlace) {
    std::cerr << "Warning: the source files will be overwritten\n";
  }

  if (!assumeYes) {
    std::string answer;
    while (true) {
      std::cout << "Do you want to run the program (yes/no)? " << std::flush;
      if (!std::getline(std::cin, answer) || answer == "n" || answer == "no") {
        return 0;
      }
      if (answer == "y" || answer == "yes") {
        break;
      }
    }
  }

  cohanon::Error error;
  auto tasks = cohanon::planTasks(options, &error);
  if (!tasks) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }
  std::cout << tasks->size() << " file(s) will be "
            << (options.convertOnly ? "converted" : "anonymised") << ".\n";

  std::signal(SIGINT, onInterrupt);

  auto report = cohanon::runBatch(
      *tasks, options, &cancellation,
      [&](size_t completed, size_t total, const cohanon::TaskResult &result) {
        const auto &target = options.convertOnly ? *result.task.converted : result.task.destination;
        std::cout << "(" << completed << "/" << total << ") " << result.task.source.string()
                  << " --> " << target.string() << "\n";

        if (!result.ok()) {
          std::cerr << "  " << cohanon::toString(result.error.kind) << ": "
                    << result.error.message << "\n";
          if (!result.error.diagnostics.empty()) {
            std::cerr << result.error.diagnostics << "\n";
          }
        } else if (result.conversionSkipped) {
          std::cout << "  File has already been converted.\n";
        }

        if (verbose && result.anonymised) {
          printFields("To:", result.task.destination);
        }
      });

  std::cout << "Done: " << report.succeeded << " succeeded, " << report.failed << " failed";
  if (report.notStarted > 0) {
    std::cout << ", " << report.notStarted << " cancelled";
  }
  std::cout << "\n";

  return report.allSucceeded() ? 0 : 1;
}

#include <iostream>

#include <cohanon/cohanon.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <recording.eeg>...\n";
    return 1;
  }

  int status = 0;
  for (int i = 1; i < argc; ++i) {
    cohanon::Error error;
    auto header = cohanon::inspect(argv[i], &error);

    if (!header) {
      std::cerr << "Error: " << cohanon::toString(error.kind) << ": " << error.message << "\n";
      status = 1;
      continue;
    }

    std::cout << argv[i] << "\n";
    for (const auto &spec : cohanon::fieldTable) {
      std::cout << "  " << spec.name << ": \"" << header->text(spec.field) << "\"\n";
    }
  }

  return status;
}

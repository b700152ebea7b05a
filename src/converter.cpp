#include <algorithm>
#include <format>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <cohanon/converter.hpp>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <thread>

#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace cohanon {

namespace {

// Upper bound on captured converter output
constexpr size_t maxDiagnostics = 64 * 1024;

void appendDiagnostics(std::string &diagnostics, const char *data, size_t size) {
  if (diagnostics.size() < maxDiagnostics) {
    diagnostics.append(data, std::min(size, maxDiagnostics - diagnostics.size()));
  }
}

bool fail(Error *outError, const std::filesystem::path &input, std::string message,
          std::string diagnostics = {}) {
  if (outError) {
    outError->kind = ErrorKind::ConversionFailed;
    outError->path = input;
    outError->message = std::move(message);
    outError->diagnostics = std::move(diagnostics);
  }
  return false;
}

#if !defined(_WIN32)

// Report a failed exec from the forked child. Only async-signal-safe calls.
void writeExecFailure(int error) {
  char message[40] = "exec failed: errno ";
  size_t length = 19;
  char digits[12];
  size_t count = 0;
  do {
    digits[count++] = static_cast<char>('0' + error % 10);
    error /= 10;
  } while (error > 0 && count < sizeof(digits));
  while (count > 0) {
    message[length++] = digits[--count];
  }
  message[length++] = '\n';
  (void)!write(STDERR_FILENO, message, length);
}

#endif

#if defined(_WIN32)

std::wstring widen(const std::string &s) {
  if (s.empty()) {
    return std::wstring();
  }
  const int n = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, nullptr, 0);
  if (n <= 0) {
    return std::wstring();
  }
  std::wstring w(static_cast<size_t>(n - 1), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, w.data(), n);
  return w;
}

// Quote one argument for CommandLineToArgvW-style parsing
std::string quoteArgument(const std::string &arg) {
  std::string quoted = "\"";
  size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      ++backslashes;
      continue;
    }
    if (c == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
    } else {
      quoted.append(backslashes, '\\');
    }
    backslashes = 0;
    quoted += c;
  }
  quoted.append(backslashes * 2, '\\');
  quoted += '"';
  return quoted;
}

#endif

} // namespace

bool convert(const std::filesystem::path &executable, const std::filesystem::path &input,
             const std::filesystem::path &output, const ConvertOptions &options,
             Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(executable, ec)) {
    return fail(outError, input,
                std::format("Converter executable not found: {}", executable.string()));
  }

  std::string diagnostics;
  const bool bounded = options.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;

#if defined(_WIN32)
  SECURITY_ATTRIBUTES sa{};
  sa.nLength = sizeof(sa);
  sa.bInheritHandle = TRUE;

  HANDLE readEnd = nullptr;
  HANDLE writeEnd = nullptr;
  if (!CreatePipe(&readEnd, &writeEnd, &sa, 0)) {
    return fail(outError, input,
                std::format("CreatePipe failed (win32_error={})", GetLastError()));
  }
  SetHandleInformation(readEnd, HANDLE_FLAG_INHERIT, 0);

  std::string commandLine = quoteArgument(executable.string()) + " " +
                            quoteArgument(input.string()) + " " + quoteArgument(output.string());
  std::wstring commandLineW = widen(commandLine);
  std::vector<wchar_t> commandBuffer(commandLineW.begin(), commandLineW.end());
  commandBuffer.push_back(L'\0');

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags |= STARTF_USESTDHANDLES;
  si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
  si.hStdOutput = writeEnd;
  si.hStdError = writeEnd;

  PROCESS_INFORMATION pi{};
  const BOOL launched = CreateProcessW(nullptr, commandBuffer.data(), nullptr, nullptr, TRUE,
                                       CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
  const DWORD launchError = GetLastError();
  CloseHandle(writeEnd);

  if (!launched) {
    CloseHandle(readEnd);
    return fail(outError, input,
                std::format("Failed to launch {} (win32_error={})", executable.string(),
                            launchError));
  }
  CloseHandle(pi.hThread);

  std::thread reader([&diagnostics, readEnd] {
    char chunk[4096];
    DWORD n = 0;
    while (ReadFile(readEnd, chunk, sizeof(chunk), &n, nullptr) && n > 0) {
      appendDiagnostics(diagnostics, chunk, n);
    }
  });

  const DWORD wait = WaitForSingleObject(
      pi.hProcess, bounded ? static_cast<DWORD>(options.timeout.count()) : INFINITE);
  bool timedOut = false;
  if (wait == WAIT_TIMEOUT) {
    TerminateProcess(pi.hProcess, 1);
    WaitForSingleObject(pi.hProcess, INFINITE);
    timedOut = true;
  }

  DWORD code = 1;
  GetExitCodeProcess(pi.hProcess, &code);
  CloseHandle(pi.hProcess);
  reader.join();
  CloseHandle(readEnd);

  if (timedOut) {
    return fail(outError, input,
                std::format("Converter timed out after {} ms", options.timeout.count()),
                std::move(diagnostics));
  }
  if (code != 0) {
    return fail(outError, input, std::format("Converter exited with code {}", code),
                std::move(diagnostics));
  }
  return true;

#else
  std::vector<std::string> args = {executable.string(), input.string(), output.string()};
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  // Both pipe ends must be close-on-exec before any other worker forks
#if defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return fail(outError, input,
                std::format("Failed to create pipe: {}", std::generic_category().message(errno)));
  }
  const pid_t pid = fork();
#else
  int fds[2];
  pid_t pid = -1;
  {
    static std::mutex launchMutex;
    std::lock_guard<std::mutex> lock(launchMutex);
    if (pipe(fds) < 0) {
      return fail(outError, input,
                  std::format("Failed to create pipe: {}", std::generic_category().message(errno)));
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    pid = fork();
  }
#endif
  if (pid < 0) {
    const int forkErrno = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    return fail(outError, input,
                std::format("Failed to launch {}: {}", executable.string(),
                            std::generic_category().message(forkErrno)));
  }

  if (pid == 0) {
    // Child: stdout and stderr go to the pipe
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    ::close(fds[0]);
    ::close(fds[1]);
    execv(argv[0], argv.data());
    writeExecFailure(errno);
    _exit(127);
  }

  ::close(fds[1]);
  int readEnd = fds[0];

  int status = 0;
  bool exited = false;
  bool lost = false;
  bool timedOut = false;
  char chunk[4096];

  while (true) {
    if (readEnd >= 0) {
      pollfd pfd{readEnd, POLLIN, 0};
      const int ready = poll(&pfd, 1, 50);
      if (ready > 0) {
        const ssize_t n = read(readEnd, chunk, sizeof(chunk));
        if (n > 0) {
          appendDiagnostics(diagnostics, chunk, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
          ::close(readEnd);
          readEnd = -1;
        }
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!exited) {
      const pid_t r = waitpid(pid, &status, WNOHANG);
      lost = r < 0 && errno != EINTR;
      exited = (r == pid) || lost;
    }

    // Exited with the pipe still held open (e.g. by a grandchild): drain what is there
    if (exited && readEnd >= 0) {
      fcntl(readEnd, F_SETFL, fcntl(readEnd, F_GETFL) | O_NONBLOCK);
      ssize_t n = 0;
      while ((n = read(readEnd, chunk, sizeof(chunk))) > 0) {
        appendDiagnostics(diagnostics, chunk, static_cast<size_t>(n));
      }
      ::close(readEnd);
      readEnd = -1;
    }

    if (exited) {
      break;
    }

    if (bounded && std::chrono::steady_clock::now() >= deadline) {
      kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      if (readEnd >= 0) {
        ::close(readEnd);
      }
      timedOut = true;
      break;
    }
  }

  if (timedOut) {
    return fail(outError, input,
                std::format("Converter timed out after {} ms", options.timeout.count()),
                std::move(diagnostics));
  }
  if (lost) {
    return fail(outError, input, "Failed to wait for converter process", std::move(diagnostics));
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    return fail(outError, input,
                std::format("Converter exited with code {}", WEXITSTATUS(status)),
                std::move(diagnostics));
  }
  if (WIFSIGNALED(status)) {
    return fail(outError, input,
                std::format("Converter killed by signal {}", WTERMSIG(status)),
                std::move(diagnostics));
  }
  return true;
#endif
}

std::filesystem::path convertedPath(const std::filesystem::path &input) {
  std::filesystem::path output = input;
  output.replace_extension(".EDF");
  return output;
}

} // namespace cohanon

#include "tai/common/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tai::common {

namespace {

constexpr int kPollSliceMs = 50;
constexpr std::chrono::hours kMaxTimeout{24 * 7};

class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }
  void reset() {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

bool make_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC) == 0; }

void set_nonblocking(const int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Returns false on EOF or a hard read error.
bool drain_into(const int fd, std::string &sink, bool &truncated, const std::size_t cap) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      const std::size_t room = cap > sink.size() ? cap - sink.size() : 0;
      const std::size_t take = std::min<std::size_t>(room, static_cast<std::size_t>(n));
      sink.append(buffer.data(), take);
      if (take < static_cast<std::size_t>(n)) {
        truncated = true;
      }
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

[[noreturn]] void child_fail(const int report_fd) {
  const int err = errno;
  (void)!::write(report_fd, &err, sizeof(err));
  _exit(127);
}

void kill_group(const pid_t pid) {
  (void)::kill(-pid, SIGKILL);
  (void)::kill(pid, SIGKILL);
}

} // namespace

bool program_on_path(const std::string &program) {
  if (program.empty()) {
    return false;
  }
  if (program.find('/') != std::string::npos) {
    return ::access(program.c_str(), X_OK) == 0;
  }
  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }
  std::stringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + program;
    struct stat st {};
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

Result<ProcessOutput> run_process(const ProcessOptions &options) {
  if (options.argv.empty()) {
    return Result<ProcessOutput>::failure(ErrorKind::Validation, "empty command line");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int report_pipe[2] = {-1, -1};
  const bool feed_stdin = options.stdin_data.has_value();
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(report_pipe) ||
      (feed_stdin && !make_pipe(in_pipe))) {
    const int err = errno;
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], report_pipe[0],
                   report_pipe[1], in_pipe[0], in_pipe[1]}) {
      if (fd >= 0) {
        (void)::close(fd);
      }
    }
    return Result<ProcessOutput>::failure(ErrorKind::Process,
                                          std::string("Failed to create pipe: ") +
                                              std::strerror(err));
  }
  Fd out_read(out_pipe[0]), out_write(out_pipe[1]);
  Fd err_read(err_pipe[0]), err_write(err_pipe[1]);
  Fd report_read(report_pipe[0]), report_write(report_pipe[1]);
  Fd in_read(in_pipe[0]), in_write(in_pipe[1]);

  std::vector<char *> argv;
  argv.reserve(options.argv.size() + 1);
  for (const auto &arg : options.argv) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const std::string working_dir = options.working_dir.string();

  const pid_t pid = ::fork();
  if (pid < 0) {
    return Result<ProcessOutput>::failure(ErrorKind::Process,
                                          std::string("Failed to fork: ") + std::strerror(errno));
  }

  if (pid == 0) {
    (void)::setpgid(0, 0);
    int stdin_fd = -1;
    if (feed_stdin) {
      stdin_fd = in_read.get();
    } else {
      stdin_fd = ::open("/dev/null", O_RDONLY);
      if (stdin_fd < 0) {
        child_fail(report_write.get());
      }
    }
    if (::dup2(stdin_fd, STDIN_FILENO) < 0 || ::dup2(out_write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err_write.get(), STDERR_FILENO) < 0) {
      child_fail(report_write.get());
    }
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
      child_fail(report_write.get());
    }
    std::signal(SIGPIPE, SIG_DFL);
    ::execvp(argv[0], argv.data());
    child_fail(report_write.get());
  }

  (void)::setpgid(pid, pid);
  out_write.reset();
  err_write.reset();
  report_write.reset();
  in_read.reset();

  int exec_errno = 0;
  ssize_t reported = 0;
  do {
    reported = ::read(report_read.get(), &exec_errno, sizeof(exec_errno));
  } while (reported < 0 && errno == EINTR);
  report_read.reset();
  if (reported == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)::waitpid(pid, &status, 0);
    return Result<ProcessOutput>::failure(ErrorKind::Process,
                                          "Failed to execute " + options.argv.front() + ": " +
                                              std::strerror(exec_errno));
  }

  set_nonblocking(out_read.get());
  set_nonblocking(err_read.get());
  if (in_write.valid()) {
    set_nonblocking(in_write.get());
  }

  ProcessOutput output;
  const std::string empty;
  const std::string &input = feed_stdin ? *options.stdin_data : empty;
  std::size_t input_written = 0;
  if (feed_stdin && input.empty()) {
    in_write.reset();
  }

  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + std::clamp(options.timeout, std::chrono::milliseconds::zero(),
                                             std::chrono::milliseconds(kMaxTimeout));

  int status = 0;
  bool exited = false;
  while (!exited) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      kill_group(pid);
      (void)::waitpid(pid, &status, 0);
      output.timed_out = true;
      return Result<ProcessOutput>::success(std::move(output));
    }
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int wait_ms = static_cast<int>(std::min<long long>(left + 1, kPollSliceMs));

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    if (out_read.valid()) {
      fds[count++] = pollfd{.fd = out_read.get(), .events = POLLIN, .revents = 0};
    }
    if (err_read.valid()) {
      fds[count++] = pollfd{.fd = err_read.get(), .events = POLLIN, .revents = 0};
    }
    if (in_write.valid()) {
      fds[count++] = pollfd{.fd = in_write.get(), .events = POLLOUT, .revents = 0};
    }
    if (count > 0) {
      (void)::poll(fds.data(), count, wait_ms);
    } else {
      (void)::poll(nullptr, 0, wait_ms);
    }

    if (out_read.valid() && !drain_into(out_read.get(), output.stdout_text,
                                        output.stdout_truncated, options.max_output_bytes)) {
      out_read.reset();
    }
    if (err_read.valid() && !drain_into(err_read.get(), output.stderr_text,
                                        output.stderr_truncated, options.max_output_bytes)) {
      err_read.reset();
    }
    if (in_write.valid()) {
      const ssize_t n = ::write(in_write.get(), input.data() + input_written,
                                input.size() - input_written);
      if (n > 0) {
        input_written += static_cast<std::size_t>(n);
      }
      if ((n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) ||
          input_written >= input.size()) {
        in_write.reset();
      }
    }

    const pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      exited = true;
    } else if (done < 0 && errno != EINTR) {
      return Result<ProcessOutput>::failure(ErrorKind::Process,
                                            std::string("waitpid failed: ") +
                                                std::strerror(errno));
    }
  }

  // Collect whatever the child wrote before exiting. Descendants that keep the
  // pipes open are not waited for.
  if (out_read.valid()) {
    (void)drain_into(out_read.get(), output.stdout_text, output.stdout_truncated,
                     options.max_output_bytes);
  }
  if (err_read.valid()) {
    (void)drain_into(err_read.get(), output.stderr_text, output.stderr_truncated,
                     options.max_output_bytes);
  }

  if (WIFEXITED(status)) {
    output.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    output.term_signal = WTERMSIG(status);
  }
  return Result<ProcessOutput>::success(std::move(output));
}

} // namespace tai::common

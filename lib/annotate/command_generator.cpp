// docgraph/annotate/command_generator.cpp - Generator backed by an external command
#include "docgraph/annotate/command_generator.hpp"

#include <fcntl.h>
#include <fmt/core.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace docgraph
{

namespace
{

constexpr size_t k_max_stderr_in_message = 512;

void close_fd(int & fd)
{
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Child
{
  pid_t pid = -1;
  int in_fd = -1;
  int out_fd = -1;
  int err_fd = -1;

  ~Child()
  {
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);
  }
};

bool spawn(const std::vector<std::string> & args, Child & child, std::string & error)
{
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};

  auto close_all = [&]() {
    for (int * p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  // Close-on-exec so that children spawned by concurrent requests do not keep
  // each other's pipe ends open; dup2 clears the flag on 0/1/2.
  if (
    ::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
    ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    error = fmt::format("pipe failed: {}", std::strerror(errno));
    close_all();
    return false;
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto & a : args) {
    argv.push_back(const_cast<char *>(a.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = fmt::format("fork failed: {}", std::strerror(errno));
    close_all();
    return false;
  }

  if (pid == 0) {
    // child
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    for (int * p : {in_pipe, out_pipe, err_pipe}) {
      ::close(p[0]);
      ::close(p[1]);
    }
    ::execvp(argv[0], argv.data());
    std::perror("execvp");
    _exit(127);
  }

  // parent
  child.pid = pid;
  child.in_fd = in_pipe[1];
  child.out_fd = out_pipe[0];
  child.err_fd = err_pipe[0];
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  return true;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline)
{
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
    deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Feed stdin and drain stdout/stderr until both outputs reach EOF.
// Returns false on timeout.
bool exchange(
  Child & child, const std::string & input, std::string & out, std::string & err,
  std::chrono::steady_clock::time_point deadline)
{
  size_t written = 0;
  if (input.empty()) close_fd(child.in_fd);

  char buf[4096];
  while (child.out_fd >= 0 || child.err_fd >= 0) {
    pollfd fds[3];
    nfds_t n = 0;
    int * owners[3];
    auto watch = [&](int & fd, short events) {
      if (fd < 0) return;
      fds[n].fd = fd;
      fds[n].events = events;
      fds[n].revents = 0;
      owners[n] = &fd;
      ++n;
    };
    watch(child.in_fd, POLLOUT);
    watch(child.out_fd, POLLIN);
    watch(child.err_fd, POLLIN);

    const int timeout = remaining_ms(deadline);
    if (timeout == 0) return false;
    const int pr = ::poll(fds, n, timeout);
    if (pr == 0) return false;
    if (pr < 0) {
      if (errno == EINTR) continue;
      return false;
    }

    for (nfds_t i = 0; i < n; ++i) {
      if (fds[i].revents == 0) continue;
      int & fd = *owners[i];

      if (&fd == &child.in_fd) {
        const ssize_t w = ::write(fd, input.data() + written, input.size() - written);
        if (w < 0) {
          if (errno == EINTR || errno == EAGAIN) continue;
          close_fd(fd);  // EPIPE: the command stopped reading
          continue;
        }
        written += static_cast<size_t>(w);
        if (written == input.size()) close_fd(fd);
        continue;
      }

      const ssize_t r = ::read(fd, buf, sizeof(buf));
      if (r < 0) {
        if (errno == EINTR) continue;
        close_fd(fd);
        continue;
      }
      if (r == 0) {
        close_fd(fd);
        continue;
      }
      (&fd == &child.out_fd ? out : err).append(buf, static_cast<size_t>(r));
    }
  }
  close_fd(child.in_fd);
  return true;
}

std::string trimmed_stderr(const std::string & err)
{
  std::string s = err.substr(0, k_max_stderr_in_message);
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
    s.pop_back();
  }
  return s;
}

}  // namespace

CommandGenerator::CommandGenerator(
  std::vector<std::string> argv, std::chrono::milliseconds timeout)
: argv_(std::move(argv)), timeout_(timeout)
{
  static std::once_flag ignore_sigpipe;
  std::call_once(ignore_sigpipe, []() { std::signal(SIGPIPE, SIG_IGN); });
}

GenerationResult CommandGenerator::generate(const nlohmann::json & request)
{
  if (argv_.empty()) {
    return GenerationResult::terminal("no annotation command configured");
  }

  Child child;
  std::string error;
  if (!spawn(argv_, child, error)) {
    return GenerationResult::transient(error);
  }

  std::string out;
  std::string err;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  const bool finished = exchange(child, request.dump(), out, err, deadline);

  int status = 0;
  if (!finished) {
    ::kill(child.pid, SIGKILL);
    (void)::waitpid(child.pid, &status, 0);
    return GenerationResult::transient(
      fmt::format("'{}' timed out after {} ms", argv_.front(), timeout_.count()));
  }

  while (::waitpid(child.pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return GenerationResult::terminal(fmt::format("waitpid failed: {}", std::strerror(errno)));
    }
  }

  if (WIFSIGNALED(status)) {
    return GenerationResult::terminal(
      fmt::format("'{}' killed by signal {}", argv_.front(), WTERMSIG(status)));
  }

  const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (code == k_transient_exit_status) {
    return GenerationResult::transient(
      fmt::format("'{}' asked for a retry: {}", argv_.front(), trimmed_stderr(err)));
  }
  if (code != 0) {
    return GenerationResult::terminal(
      fmt::format("'{}' exited with status {}: {}", argv_.front(), code, trimmed_stderr(err)));
  }

  try {
    return GenerationResult::ok(nlohmann::json::parse(out));
  } catch (const nlohmann::json::parse_error & e) {
    return GenerationResult::terminal(fmt::format("unparsable response: {}", e.what()));
  }
}

}  // namespace docgraph

#include "shell.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace provision {
namespace {

constexpr int kExecFailedExit{ 127 };

[[noreturn]] void throw_errno(char const *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

class owned_fd {
 public:
  owned_fd() = default;
  explicit owned_fd(int fd) : fd_{ fd } {}
  owned_fd(owned_fd &&other) noexcept : fd_{ std::exchange(other.fd_, -1) } {}
  owned_fd &operator=(owned_fd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  ~owned_fd() { reset(); }

  int get() const { return fd_; }
  void reset() {
    if (fd_ != -1) { ::close(fd_); }
    fd_ = -1;
  }

 private:
  int fd_{ -1 };
};

struct pipe_pair {
  owned_fd read_end;
  owned_fd write_end;
};

pipe_pair make_pipe() {
  int fds[2];
  if (::pipe(fds) == -1) { throw_errno("pipe failed"); }
  pipe_pair p{ owned_fd{ fds[0] }, owned_fd{ fds[1] } };
  // The child dup2s the write end onto stdout/stderr; the originals close on exec.
  for (int const fd : fds) {
    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) { throw_errno("fcntl failed"); }
  }
  return p;
}

// Holds the strings and the null-terminated pointer array execve wants.
struct c_strings {
  std::vector<std::string> storage;
  std::vector<char *> ptrs;

  void seal() {
    ptrs.clear();
    for (auto &s : storage) { ptrs.push_back(s.data()); }
    ptrs.push_back(nullptr);
  }
};

c_strings shell_argv(std::string_view script, shell_run_cfg const &cfg) {
  c_strings argv;
  if (cfg.shell == shell_choice::bash) {
    argv.storage = { "/usr/bin/env", "bash" };
  } else {
    argv.storage = { "/bin/sh" };
  }
  if (cfg.strict) { argv.storage.emplace_back("-e"); }
  argv.storage.emplace_back("-c");
  argv.storage.emplace_back(script);
  argv.seal();
  return argv;
}

c_strings shell_envp(shell_env_t const &env) {
  c_strings envp;
  envp.storage.reserve(env.size());
  for (auto const &[key, value] : env) { envp.storage.push_back(key + "=" + value); }
  envp.seal();
  return envp;
}

// Only async-signal-safe calls between fork and execve.
[[noreturn]] void run_child(int out_fd,
                            int err_fd,
                            std::optional<std::filesystem::path> const &cwd,
                            c_strings &argv,
                            c_strings &envp) {
  int const devnull{ ::open("/dev/null", O_RDONLY) };
  if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1 ||
      ::dup2(out_fd, STDOUT_FILENO) == -1 || ::dup2(err_fd, STDERR_FILENO) == -1) {
    _exit(kExecFailedExit);
  }

  if (cwd && ::chdir(cwd->c_str()) == -1) {
    std::perror("chdir");
    _exit(kExecFailedExit);
  }

  ::execve(argv.ptrs[0], argv.ptrs.data(), envp.ptrs.data());
  std::perror("execve");
  _exit(kExecFailedExit);
}

struct line_reader {
  owned_fd fd;
  shell_stream stream;
  std::string partial;
};

void emit(shell_run_cfg const &cfg, shell_stream stream, std::string_view line) {
  auto const &per_stream{ stream == shell_stream::std_out ? cfg.on_stdout_line
                                                          : cfg.on_stderr_line };
  if (per_stream) { per_stream(line); }
  if (cfg.on_output_line) { cfg.on_output_line(line); }
}

// Reads once; at EOF flushes the partial line and closes the reader.
void pump(line_reader &r, shell_run_cfg const &cfg) {
  std::array<char, 4096> buf;
  ssize_t n;
  do {
    n = ::read(r.fd.get(), buf.data(), buf.size());
  } while (n == -1 && errno == EINTR);
  if (n == -1) { throw_errno("read failed"); }

  if (n == 0) {
    if (!r.partial.empty()) { emit(cfg, r.stream, r.partial); }
    r.partial.clear();
    r.fd.reset();
    return;
  }

  r.partial.append(buf.data(), static_cast<std::size_t>(n));
  std::size_t start{ 0 };
  for (auto nl{ r.partial.find('\n') }; nl != std::string::npos;
       nl = r.partial.find('\n', start)) {
    emit(cfg, r.stream, std::string_view{ r.partial }.substr(start, nl - start));
    start = nl + 1;
  }
  r.partial.erase(0, start);
}

void drain(std::array<line_reader, 2> &readers, shell_run_cfg const &cfg) {
  for (;;) {
    std::array<pollfd, 2> fds{};
    int open_count{ 0 };
    for (std::size_t i{ 0 }; i < readers.size(); ++i) {
      fds[i].fd = readers[i].fd.get();  // poll ignores negative descriptors
      fds[i].events = POLLIN;
      if (fds[i].fd != -1) { ++open_count; }
    }
    if (open_count == 0) { return; }

    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("poll failed");
    }

    for (std::size_t i{ 0 }; i < readers.size(); ++i) {
      if (fds[i].fd != -1 && fds[i].revents != 0) { pump(readers[i], cfg); }
    }
  }
}

shell_result reap(pid_t pid) {
  int status{ 0 };
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) { throw_errno("waitpid failed"); }
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = 128 + sig, .signal = sig };
  }
  return { .exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : status,
           .signal = std::nullopt };
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  for (char **e{ environ }; e && *e; ++e) {
    std::string_view const kv{ *e };
    if (auto const eq{ kv.find('=') }; eq != std::string_view::npos) {
      env.insert_or_assign(std::string{ kv.substr(0, eq) },
                           std::string{ kv.substr(eq + 1) });
    }
  }
  return env;
}

shell_result shell_run(std::string_view script, shell_run_cfg const &cfg) {
  auto argv{ shell_argv(script, cfg) };
  auto envp{ shell_envp(cfg.env) };

  auto out{ make_pipe() };
  auto err{ make_pipe() };

  pid_t const pid{ ::fork() };
  if (pid == -1) { throw_errno("fork failed"); }
  if (pid == 0) {
    run_child(out.write_end.get(), err.write_end.get(), cfg.cwd, argv, envp);
  }

  out.write_end.reset();
  err.write_end.reset();

  std::array<line_reader, 2> readers{
    line_reader{ std::move(out.read_end), shell_stream::std_out, {} },
    line_reader{ std::move(err.read_end), shell_stream::std_err, {} },
  };

  try {
    drain(readers, cfg);
  } catch (...) {
    ::kill(pid, SIGKILL);
    static_cast<void>(reap(pid));
    throw;
  }
  return reap(pid);
}

}  // namespace provision

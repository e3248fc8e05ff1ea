#include <gitbridge/errors.hpp>
#include <gitbridge/markers.hpp>
#include <gitbridge/process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

extern char **environ;

namespace fs = std::filesystem;

namespace gitbridge {

namespace {

constexpr std::array<std::pair<const char *, const char *>, 3> kForcedEnv = {{
    {"GIT_TERMINAL_PROMPT", "0"},
    {"GIT_OPTIONAL_LOCKS", "0"},
    {"GIT_DISCOVERY_ACROSS_FILESYSTEM", "1"},
}};

enum LaunchStage : int { kStageChdir = 1, kStageExec = 2 };

struct LaunchReport {
  int stage;
  int err;
};

struct Fd {
  int fd = -1;
  Fd() = default;
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
  ~Fd() { close(); }
  void close() {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

int make_cloexec_pipe(Fd &r, Fd &w) {
  int pfd[2];
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) != 0)
    return -1;
#else
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
#endif
  r.fd = pfd[0];
  w.fd = pfd[1];
  return 0;
}

void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Built before fork(): the child may only call async-signal-safe functions.
std::vector<std::string> child_environment() {
  std::vector<std::string> env;
  for (char **e = environ; e && *e; ++e) {
    std::string_view kv(*e);
    bool forced = false;
    for (const auto &[k, v] : kForcedEnv) {
      std::string_view key(k);
      if (kv.size() > key.size() && kv.compare(0, key.size(), key) == 0 &&
          kv[key.size()] == '=') {
        forced = true;
        break;
      }
    }
    if (!forced)
      env.emplace_back(kv);
  }
  for (const auto &[k, v] : kForcedEnv)
    env.push_back(std::string(k) + "=" + v);
  return env;
}

std::vector<char *> as_cstrings(const std::vector<std::string> &v) {
  std::vector<char *> out;
  out.reserve(v.size() + 1);
  for (auto &s : v)
    out.push_back(const_cast<char *>(s.c_str()));
  out.push_back(nullptr);
  return out;
}

int decode_status(int st) {
  if (WIFEXITED(st))
    return WEXITSTATUS(st);
  if (WIFSIGNALED(st))
    return 128 + WTERMSIG(st);
  return -1;
}

void kill_and_reap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
  }
}

} // namespace

std::string trim(std::string_view s) {
  auto ws = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
  };
  while (!s.empty() && ws(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && ws(s.back()))
    s.remove_suffix(1);
  return std::string(s);
}

std::string combined_output(const SubprocessResult &r) {
  return trim(r.out + "\n" + r.err);
}

std::string redact_argv(const std::vector<std::string> &argv) {
  static constexpr std::string_view kHeaderKey = "http.extraHeader=";
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i)
      out += ' ';
    const auto &a = argv[i];
    if (a.compare(0, kHeaderKey.size(), kHeaderKey) == 0)
      out += std::string(kHeaderKey) + "<redacted>";
    else
      out += a;
  }
  return out;
}

SubprocessResult SubprocessRunner::run(const fs::path &working_dir,
                                       const std::vector<std::string> &args,
                                       const RunOptions &opts) {
  if (args.empty())
    throw InvalidInputError("empty argv");

  ignore_sigpipe_once();
  spdlog::debug("[run] {} (cwd={}, timeout={}ms)", redact_argv(args),
                working_dir.string(), opts.timeout_ms);

  const auto env = child_environment();
  auto envp = as_cstrings(env);
  auto argv = as_cstrings(args);
  const std::string cwd = working_dir.string();

  Fd in_r, in_w, out_r, out_w, err_r, err_w, rep_r, rep_w;
  if (make_cloexec_pipe(in_r, in_w) != 0 || make_cloexec_pipe(out_r, out_w) != 0 ||
      make_cloexec_pipe(err_r, err_w) != 0 || make_cloexec_pipe(rep_r, rep_w) != 0) {
    throw CommandFailure(fmt::format("pipe failed: {}", std::strerror(errno)), -1);
  }

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.timeout_ms);

  pid_t pid = ::fork();
  if (pid < 0)
    throw CommandFailure(fmt::format("fork failed: {}", std::strerror(errno)), -1);

  if (pid == 0) {
    ::dup2(in_r.fd, STDIN_FILENO);
    ::dup2(out_w.fd, STDOUT_FILENO);
    ::dup2(err_w.fd, STDERR_FILENO);
    LaunchReport rep{kStageChdir, 0};
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      rep.err = errno;
      (void)!::write(rep_w.fd, &rep, sizeof(rep));
      _exit(127);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    rep.stage = kStageExec;
    rep.err = errno;
    (void)!::write(rep_w.fd, &rep, sizeof(rep));
    _exit(127);
  }

  in_r.close();
  out_w.close();
  err_w.close();
  rep_w.close();

  LaunchReport rep{};
  ssize_t n;
  do {
    n = ::read(rep_r.fd, &rep, sizeof(rep));
  } while (n < 0 && errno == EINTR);
  rep_r.close();

  if (n == static_cast<ssize_t>(sizeof(rep))) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    if (rep.stage == kStageExec && (rep.err == ENOENT || rep.err == ENOTDIR)) {
      throw ExecutableNotFoundError(fmt::format(
          "Git executable not found ({}: {}). {}", args[0],
          std::strerror(rep.err), kBinaryRemedy));
    }
    if (rep.stage == kStageChdir) {
      throw CommandFailure(fmt::format("cannot enter {}: {}", cwd,
                                       std::strerror(rep.err)),
                           127);
    }
    throw CommandFailure(
        fmt::format("exec {} failed: {}", args[0], std::strerror(rep.err)), 127);
  }

  std::string payload = opts.stdin_payload.value_or(std::string{});
  size_t written = 0;
  if (!opts.stdin_payload || payload.empty()) {
    in_w.close();
  } else {
    ::fcntl(in_w.fd, F_SETFL, ::fcntl(in_w.fd, F_GETFL) | O_NONBLOCK);
  }

  SubprocessResult res;
  std::array<char, 4096> buf{};

  auto remaining_ms = [&]() -> int {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  };

  while (out_r.fd >= 0 || err_r.fd >= 0 || in_w.fd >= 0) {
    int left = remaining_ms();
    if (left == 0) {
      kill_and_reap(pid);
      spdlog::warn("[run] killed after {}ms: {}", opts.timeout_ms, redact_argv(args));
      throw TimeoutError(opts.timeout_ms);
    }

    std::array<pollfd, 3> pfds{};
    std::array<Fd *, 3> owners{};
    nfds_t cnt = 0;
    for (Fd *f : {&out_r, &err_r}) {
      if (f->fd >= 0) {
        pfds[cnt] = pollfd{f->fd, POLLIN, 0};
        owners[cnt++] = f;
      }
    }
    if (in_w.fd >= 0) {
      pfds[cnt] = pollfd{in_w.fd, POLLOUT, 0};
      owners[cnt++] = &in_w;
    }

    int pr = ::poll(pfds.data(), cnt, left);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      kill_and_reap(pid);
      throw CommandFailure(fmt::format("poll failed: {}", std::strerror(errno)), -1);
    }
    if (pr == 0)
      continue;

    for (nfds_t i = 0; i < cnt; ++i) {
      if (pfds[i].revents == 0)
        continue;
      Fd *f = owners[i];
      if (f == &in_w) {
        if (pfds[i].revents & (POLLERR | POLLHUP)) {
          in_w.close();
          continue;
        }
        ssize_t w = ::write(in_w.fd, payload.data() + written, payload.size() - written);
        if (w > 0) {
          written += static_cast<size_t>(w);
          if (written >= payload.size())
            in_w.close();
        } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
          in_w.close();
        }
        continue;
      }
      ssize_t r = ::read(f->fd, buf.data(), buf.size());
      if (r > 0) {
        (f == &out_r ? res.out : res.err).append(buf.data(), static_cast<size_t>(r));
      } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
        f->close();
      }
    }
  }

  int st = 0;
  for (;;) {
    pid_t w = ::waitpid(pid, &st, WNOHANG);
    if (w == pid)
      break;
    if (w < 0 && errno != EINTR) {
      throw CommandFailure(fmt::format("waitpid failed: {}", std::strerror(errno)), -1);
    }
    if (remaining_ms() == 0) {
      kill_and_reap(pid);
      throw TimeoutError(opts.timeout_ms);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  const int code = decode_status(st);
  if (std::find(opts.ok_codes.begin(), opts.ok_codes.end(), code) != opts.ok_codes.end())
    return res;

  std::string msg = trim(res.err);
  if (msg.empty())
    msg = trim(res.out);
  if (msg.empty())
    msg = fmt::format("{} exited with code {}", fs::path(args[0]).filename().string(), code);

  if (markers::match(msg, markers::command_error()) == Outcome::NotARepository)
    throw NotARepositoryError();

  spdlog::debug("[run] exit={} {}", code, msg);
  throw CommandFailure(msg, code, std::move(res.out), std::move(res.err));
}

} // namespace gitbridge

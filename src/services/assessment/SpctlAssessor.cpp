#include "SpctlAssessor.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "PlistReader.hpp"
#include "core/Errors.hpp"

namespace sigdrift {

namespace {

// Owns one pipe end.
struct Fd {
  int fd = -1;
  Fd() = default;
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
  ~Fd() { reset(); }
  void reset() {
    if (fd >= 0) ::close(fd);
    fd = -1;
  }
};

bool make_pipe(Fd& r, Fd& w) {
  int p[2];
  if (::pipe(p) != 0) return false;
  r.fd = p[0];
  w.fd = p[1];
  return true;
}

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

std::string rtrim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t'))
    s.pop_back();
  return s;
}

std::string join(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

} // namespace

ProcessOutput run_process(const std::vector<std::string>& argv) {
  if (argv.empty()) throw std::invalid_argument("run_process: empty argv");

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  Fd outR, outW, errR, errW;
  if (!make_pipe(outR, outW) || !make_pipe(errR, errW)) {
    return {127, {}, errno_text("pipe")};
  }

  const pid_t pid = ::fork();
  if (pid < 0) return {127, {}, errno_text("fork")};

  if (pid == 0) {
    ::dup2(outW.fd, STDOUT_FILENO);
    ::dup2(errW.fd, STDERR_FILENO);
    ::close(outR.fd); ::close(outW.fd);
    ::close(errR.fd); ::close(errW.fd);
    ::execvp(args[0], args.data());
    const char* reason = std::strerror(errno);
    (void)!::write(STDERR_FILENO, "cannot execute ", 15);
    (void)!::write(STDERR_FILENO, args[0], std::strlen(args[0]));
    (void)!::write(STDERR_FILENO, ": ", 2);
    (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
    _exit(127);
  }

  outW.reset();
  errW.reset();

  ProcessOutput result;
  pollfd fds[2] = {{outR.fd, POLLIN, 0}, {errR.fd, POLLIN, 0}};
  std::string* sinks[2] = {&result.out, &result.err};
  int open_fds = 2;
  char buf[4096];
  while (open_fds > 0) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      result.err += errno_text("poll");
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        sinks[i]->append(buf, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;  // closed by Fd on return
        --open_fds;
      }
    }
  }
  outR.reset();
  errR.reset();

  int wstatus = 0;
  while (::waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR) {
      result.status = 127;
      result.err += errno_text("waitpid");
      return result;
    }
  }
  if (WIFEXITED(wstatus)) result.status = WEXITSTATUS(wstatus);
  else if (WIFSIGNALED(wstatus)) result.status = 128 + WTERMSIG(wstatus);
  else result.status = 127;
  return result;
}

std::vector<std::string> SpctlAssessor::commandFor(const std::string& path, AssessmentMode mode) const {
  std::vector<std::string> argv{tool_, "--assess", "--raw", "--type", to_string(mode)};
  if (mode == AssessmentMode::Open) {
    argv.emplace_back("--context");
    argv.emplace_back("context:primary-signature");
  }
  argv.push_back(path);
  return argv;
}

AssessmentResult SpctlAssessor::assess(const std::string& path, AssessmentMode mode) {
  const auto argv = commandFor(path, mode);
  spdlog::debug("running: {}", join(argv));

  ProcessOutput p = run_process(argv);

  AssessmentResult r;
  r.status = p.status;
  r.diagnostics = rtrim(std::move(p.err));
  if (r.status != 0) return r;

  try {
    r.properties = read_plist_dict(p.out);
  } catch (const std::exception& e) {
    throw ContractError(tool_ + " succeeded for " + path + " but its output is unusable: " + e.what());
  }
  return r;
}

} // namespace sigdrift

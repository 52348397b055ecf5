#include <svcman/io.hpp>
#include <svcman/process.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

extern char** environ;

namespace svcman {

static std::system_error errno_error(int err, const std::string& what) {
  return std::system_error(err, std::generic_category(), what);
}

static int decode_status(int st) {
  return WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
}

// inherited environment with `extra` applied on top; later entries win
static std::vector<std::string> merged_env(const std::vector<std::string>& extra) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) out.emplace_back(*e);
  for (const auto& kv : extra) {
    auto key = kv.substr(0, kv.find('='));
    bool replaced = false;
    for (auto& cur : out) {
      if (cur.compare(0, key.size(), key) == 0 && cur.size() > key.size() &&
          cur[key.size()] == '=') {
        cur = kv;
        replaced = true;
        break;
      }
    }
    if (!replaced) out.push_back(kv);
  }
  return out;
}

Process Process::spawn(const LaunchSpec& spec) {
  if (spec.executable.empty())
    throw errno_error(ENOENT, "spawn: empty command");

  io::ensure_dir(spec.dir);

  // everything the child touches is prepared before fork
  std::vector<char*> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(const_cast<char*>(spec.executable.c_str()));
  for (auto& a : spec.args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  auto env = merged_env(spec.env);
  std::vector<char*> envp;
  envp.reserve(env.size() + 1);
  for (auto& kv : env) envp.push_back(const_cast<char*>(kv.c_str()));
  envp.push_back(nullptr);

  io::UniqueFd devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (!devnull) throw errno_error(errno, "open /dev/null");

  int pfd[2];
  if (io::make_cloexec_pipe(pfd) != 0) throw errno_error(errno, "pipe");
  io::UniqueFd rd(pfd[0]), wr(pfd[1]);

  pid_t pid = ::fork();
  if (pid < 0) throw errno_error(errno, "fork");

  if (pid == 0) {
    ::dup2(devnull.get(), STDIN_FILENO);
    if (!spec.dir.empty() && ::chdir(spec.dir.c_str()) != 0) {
      int err = errno;
      (void)!::write(wr.get(), &err, sizeof(err));
      _exit(127);
    }
    ::environ = envp.data();
    ::execvp(argv[0], argv.data());

    int err = errno;
    (void)!::write(wr.get(), &err, sizeof(err));
    _exit(127);
  }

  wr.reset();
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(rd.get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    throw errno_error(child_errno, "exec " + spec.executable);
  }
  return Process(pid, true);
}

Process::Process(Process&& o) noexcept
  : pid_(o.pid_), terminate_on_end_(o.terminate_on_end_), exit_code_(o.exit_code_) {
  o.pid_ = 0;
  o.terminate_on_end_ = false;
}

Process& Process::operator=(Process&& o) noexcept {
  if (this != &o) {
    terminate_if_owned();
    pid_ = o.pid_;
    terminate_on_end_ = o.terminate_on_end_;
    exit_code_ = o.exit_code_;
    o.pid_ = 0;
    o.terminate_on_end_ = false;
  }
  return *this;
}

Process::~Process() { terminate_if_owned(); }

void Process::terminate_if_owned() noexcept {
  if (pid_ > 0 && terminate_on_end_ && !exit_code_) {
    ::kill(pid_, SIGKILL);
    int st = 0;
    while (::waitpid(pid_, &st, 0) < 0 && errno == EINTR) {}
  }
}

void Process::signal(int sig) const {
  if (::kill(pid_, sig) != 0)
    throw errno_error(errno, "signal " + std::to_string(sig) + " to pid " + std::to_string(pid_));
}

bool Process::alive() {
  if (exit_code_) return false;
  int st = 0;
  pid_t r = ::waitpid(pid_, &st, WNOHANG);
  if (r == pid_) {
    exit_code_ = decode_status(st);
    return false;
  }
  if (r == 0) return true;
  // not our child
  return ::kill(pid_, 0) == 0;
}

void Process::kill() {
  if (exit_code_) return;
  if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH)
    throw errno_error(errno, "kill pid " + std::to_string(pid_));
  (void)wait();
}

std::optional<int> Process::wait() {
  if (exit_code_) return exit_code_;
  int st = 0;
  for (;;) {
    pid_t r = ::waitpid(pid_, &st, 0);
    if (r == pid_) break;
    if (r < 0 && errno == EINTR) continue;
    return std::nullopt; // ECHILD: started by someone else
  }
  exit_code_ = decode_status(st);
  return exit_code_;
}

bool Process::wait_for(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (!alive()) return true;
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

} // namespace svcman

#include "launcher/process_launcher.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <utility>

namespace omni_supervisor::launcher {

namespace {

[[noreturn]] void report_and_exit(const int status_fd, int error_code) noexcept {
  const ssize_t written = ::write(status_fd, &error_code, sizeof(error_code));
  (void)written;
  _exit(127);
}

bool wait_for_child(const pid_t pid) noexcept {
  int status = 0;
  pid_t result = -1;
  do {
    result = waitpid(pid, &status, 0);
  } while (result < 0 && errno == EINTR);
  return result == pid && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}  // namespace

LaunchTarget make_launch_target(const core::LaunchConfig& config) {
  LaunchTarget target{config.name};
  for (const auto& executable : config.executables) {
    target.alternatives.push_back(LaunchSpec{executable, config.args, config.working_dir});
  }
  return target;
}

ProcessLauncher::ProcessLauncher(CompletionFn on_complete) : on_complete_(std::move(on_complete)) {}

ProcessLauncher::~ProcessLauncher() { task_.stop(); }

bool ProcessLauncher::spawn(const LaunchSpec& spec) noexcept {
  if (spec.executable.empty()) {
    std::cerr << "[launcher] skipping launch spec with empty executable\n";
    notify(spec, false);
    return false;
  }

  std::vector<char*> argv;
  try {
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& arg : spec.args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
  } catch (const std::exception& ex) {
    std::cerr << "[launcher] " << spec.executable << ": " << ex.what() << '\n';
    notify(spec, false);
    return false;
  }
  const char* working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

  int status_pipe[2]{};
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    std::cerr << "[launcher] " << spec.executable << ": pipe failed: " << std::strerror(errno) << '\n';
    notify(spec, false);
    return false;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int fork_errno = errno;
    close(status_pipe[0]);
    close(status_pipe[1]);
    std::cerr << "[launcher] " << spec.executable << ": fork failed: " << std::strerror(fork_errno) << '\n';
    notify(spec, false);
    return false;
  }

  if (pid == 0) {
    close(status_pipe[0]);
    setsid();

    const pid_t grandchild = fork();
    if (grandchild < 0) {
      _exit(1);
    }
    if (grandchild > 0) {
      _exit(0);
    }

    if (working_dir != nullptr && chdir(working_dir) != 0) {
      report_and_exit(status_pipe[1], errno);
    }

    const int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) {
        close(devnull);
      }
    }

    execvp(argv[0], argv.data());
    report_and_exit(status_pipe[1], errno);
  }

  close(status_pipe[1]);
  const bool intermediate_ok = wait_for_child(pid);

  int exec_errno = 0;
  ssize_t bytes_read = -1;
  do {
    bytes_read = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (bytes_read < 0 && errno == EINTR);
  close(status_pipe[0]);

  bool started = intermediate_ok && bytes_read == 0;
  if (!intermediate_ok) {
    std::cerr << "[launcher] " << spec.executable << ": detach fork failed\n";
  } else if (bytes_read > 0) {
    std::cerr << "[launcher] " << spec.executable << ": " << std::strerror(exec_errno) << '\n';
  } else if (bytes_read < 0) {
    std::cerr << "[launcher] " << spec.executable << ": unable to read launch status\n";
    started = false;
  } else {
    std::cerr << "[launcher] started " << spec.executable << '\n';
  }

  notify(spec, started);
  return started;
}

void ProcessLauncher::launch_all(const std::vector<LaunchSpec>& specs) noexcept {
  for (const auto& spec : specs) {
    (void)spawn(spec);
  }
}

std::size_t ProcessLauncher::launch_all(const std::vector<LaunchTarget>& targets) noexcept {
  std::size_t started = 0;
  for (const auto& target : targets) {
    bool target_started = false;
    for (const auto& alternative : target.alternatives) {
      if (spawn(alternative)) {
        target_started = true;
        break;
      }
    }

    if (target_started) {
      ++started;
    } else {
      std::cerr << "[launcher] no alternative of " << target.name << " could be started\n";
    }
  }
  return started;
}

void ProcessLauncher::launch_all_async(std::vector<LaunchTarget> targets) {
  task_.start([this, targets = std::move(targets)](const std::stop_token& st) {
    for (const auto& target : targets) {
      if (st.stop_requested()) {
        return;
      }
      (void)launch_all(std::vector<LaunchTarget>{target});
    }
  });
}

void ProcessLauncher::wait() { task_.join(); }

void ProcessLauncher::notify(const LaunchSpec& spec, const bool started) noexcept {
  if (!on_complete_) {
    return;
  }
  try {
    on_complete_(spec, started);
  } catch (const std::exception& ex) {
    std::cerr << "[launcher] completion callback failed: " << ex.what() << '\n';
  }
}

}  // namespace omni_supervisor::launcher

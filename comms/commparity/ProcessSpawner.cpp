// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/ProcessSpawner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <glog/logging.h>

#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityLogging.hpp"

namespace commparity {

namespace {

bool writeAll(int fd, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    auto rc = ::write(fd, data.data() + written, data.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(rc);
  }
  return true;
}

std::string readAll(int fd) {
  std::string data;
  char buf[4096];
  while (true) {
    auto rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "read failed");
    }
    if (rc == 0) {
      return data;
    }
    data.append(buf, static_cast<size_t>(rc));
  }
}

WorkerReport runEntry(const WorkerEntry& entry, const WorkerArgs& args) {
  WorkerReport report;
  try {
    report = entry(args);
  } catch (const ParityException& e) {
    report.state = WorkerState::FAILED;
    report.error_kind = e.kind();
    report.message = e.what();
  } catch (const std::exception& e) {
    report.state = WorkerState::FAILED;
    report.message = e.what();
  }
  report.rank = args.rank;
  return report;
}

// Runs in the forked child and returns its exit status.
int runChild(const WorkerEntry& entry, const WorkerArgs& args, int report_fd) {
  auto report = runEntry(entry, args);

  if (!writeAll(report_fd, report.serialize())) {
    CP_LOG(ERROR) << "Failed to write worker report: " << std::strerror(errno);
  }
  ::close(report_fd);

  if (!report.succeeded()) {
    CP_LOG(ERROR) << "Worker failed: " << report.describe();
  }
  ::google::FlushLogFiles(::google::GLOG_INFO);
  return report.succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
}

// Never returns. Whatever escapes runChild ends the child with a failure
// status and no report instead of unwinding into the parent's stack.
[[noreturn]] void childMain(
    const WorkerEntry& entry,
    const WorkerArgs& args,
    int report_fd) {
  int exit_status = EXIT_FAILURE;
  try {
    exit_status = runChild(entry, args, report_fd);
  } catch (const std::exception& e) {
    std::fprintf(
        stderr,
        "commparity worker for rank %d failed to report: %s\n",
        args.rank,
        e.what());
  } catch (...) {
    std::fprintf(
        stderr,
        "commparity worker for rank %d failed to report: unknown exception\n",
        args.rank);
  }
  std::fflush(stderr);
  ::_exit(exit_status);
}

// Appends whatever is readable right now without blocking.
void readAvailable(int fd, std::string& data) {
  char buf[4096];
  while (true) {
    struct pollfd pfd = {.fd = fd, .events = POLLIN, .revents = 0};
    int ready = ::poll(&pfd, 1, 0);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (ready == 0 || !(pfd.revents & (POLLIN | POLLHUP))) {
      return;
    }
    auto rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "read failed");
    }
    if (rc == 0) {
      return;
    }
    data.append(buf, static_cast<size_t>(rc));
  }
}

class ForkJoinHandle : public JoinHandle {
 public:
  ForkJoinHandle(int rank, pid_t pid, int report_fd)
      : rank_(rank), pid_(pid), report_fd_(report_fd) {}

  ~ForkJoinHandle() override {
    if (!joined_ && !exit_status_) {
      // Never leave a child running or unreaped behind
      ::kill(pid_, SIGKILL);
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
    if (report_fd_ >= 0) {
      ::close(report_fd_);
    }
  }

  ForkJoinHandle(const ForkJoinHandle&) = delete;
  ForkJoinHandle& operator=(const ForkJoinHandle&) = delete;

  int getRank() const override {
    return rank_;
  }

  bool finished() override {
    if (joined_ || exit_status_) {
      return true;
    }
    // Drain the pipe so a child writing a large report never blocks on it.
    readAvailable(report_fd_, payload_);
    int status = 0;
    pid_t rc = 0;
    do {
      rc = ::waitpid(pid_, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (rc == 0) {
      return false;
    }
    exit_status_ = status;
    return true;
  }

  WorkerOutcome join() override {
    if (joined_) {
      throw std::logic_error(
          fmt::format("Worker for rank {} was already joined", rank_));
    }

    std::string payload = std::move(payload_);
    payload += readAll(report_fd_);
    ::close(report_fd_);
    report_fd_ = -1;

    if (!exit_status_) {
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
          throw std::system_error(
              errno, std::generic_category(), "waitpid failed");
        }
      }
      exit_status_ = status;
    }
    joined_ = true;
    const int status = *exit_status_;

    WorkerOutcome outcome;
    outcome.rank = rank_;
    if (WIFEXITED(status)) {
      outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      outcome.term_signal = WTERMSIG(status);
    }
    if (!payload.empty()) {
      try {
        outcome.report = WorkerReport::deserialize(payload);
      } catch (const std::invalid_argument& e) {
        CP_LOG(ERROR) << "Discarding malformed report from rank " << rank_
                      << ": " << e.what();
      }
    }
    return outcome;
  }

  void terminate() override {
    if (!joined_ && !exit_status_) {
      ::kill(pid_, SIGKILL);
    }
  }

 private:
  const int rank_;
  const pid_t pid_;
  int report_fd_;
  bool joined_{false};
  // Report bytes read while polling
  std::string payload_;
  // Raw waitpid status once the child was reaped
  std::optional<int> exit_status_;
};

} // namespace

void ForkProcessSpawner::start() {
  if (started_) {
    throw std::logic_error("ForkProcessSpawner already started");
  }
  started_ = true;
  CP_LOG(INFO) << "Fork spawner session started";
}

std::unique_ptr<JoinHandle> ForkProcessSpawner::spawn(
    const WorkerEntry& entry,
    const WorkerArgs& args) {
  if (!started_) {
    throw std::logic_error("ForkProcessSpawner used before start()");
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2 failed");
  }

  // Buffered output would otherwise be flushed by parent and child alike
  std::fflush(nullptr);
  ::google::FlushLogFiles(::google::GLOG_INFO);

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    throw std::system_error(err, std::generic_category(), "fork failed");
  }
  if (pid == 0) {
    ::close(fds[0]);
    childMain(entry, args, fds[1]);
  }

  ::close(fds[1]);
  CP_LOG(INFO) << "Spawned worker for rank " << args.rank << " as pid " << pid;
  return std::make_unique<ForkJoinHandle>(args.rank, pid, fds[0]);
}

void ForkProcessSpawner::shutdown() {
  if (!started_) {
    return;
  }
  started_ = false;
  std::fflush(nullptr);
  ::google::FlushLogFiles(::google::GLOG_INFO);
  CP_LOG(INFO) << "Fork spawner session shut down";
}

} // namespace commparity

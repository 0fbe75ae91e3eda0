#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

namespace {

// Owns a file descriptor; closes it on scope exit.
struct FileDescriptor {
    int value = -1;

    FileDescriptor() = default;
    explicit FileDescriptor(int descriptor) : value(descriptor) {}
    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;
    ~FileDescriptor() { reset(); }

    void reset() {
        if (value >= 0) {
            ::close(value);
            value = -1;
        }
    }
};

// Written by the child into the error pipe when it fails before exec.
struct LaunchFailure {
    int error_number;
    int failed_at_chdir;
};

std::string trim_trailing_whitespace(const std::string &text) {
    size_t end = text.find_last_not_of(" \t\r\n\v\f");
    if (end == std::string::npos) {
        return "";
    }
    return text.substr(0, end + 1);
}

std::string describe_errno(int error_number, const std::string &subject) {
    return "[Errno " + std::to_string(error_number) + "] " + std::strerror(error_number) +
           ": '" + subject + "'";
}

ExecutionResult launch_failure_result(const std::string &message) {
    ExecutionResult result;
    result.stderr_text = message;
    result.exit_status = EXIT_STATUS_SENTINEL;
    result.succeeded = false;
    result.launch_failed = true;
    return result;
}

int decode_wait_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return -WTERMSIG(wait_status);
    }
    return EXIT_STATUS_SENTINEL;
}

void set_nonblocking(int descriptor) {
    int flags = ::fcntl(descriptor, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(descriptor, F_SETFL, flags | O_NONBLOCK);
    }
}

// Read whatever is available. Returns false once the descriptor reached EOF
// or failed, and closes it.
bool drain_available(FileDescriptor &descriptor, std::string &sink) {
    char buffer[8192];
    while (true) {
        ssize_t count = ::read(descriptor.value, buffer, sizeof(buffer));
        if (count > 0) {
            sink.append(buffer, static_cast<size_t>(count));
            continue;
        }
        if (count == 0) {
            descriptor.reset();
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        descriptor.reset();
        return false;
    }
}

pid_t wait_for_child(pid_t child_pid, int &wait_status, int options) {
    pid_t waited;
    do {
        waited = ::waitpid(child_pid, &wait_status, options);
    } while (waited < 0 && errno == EINTR);
    return waited;
}

std::string lock_path_for(const std::string &file_path) {
    return file_path + ".lock";
}

bool lock_descriptor(int descriptor, int operation) {
    int lock_status;
    do {
        lock_status = ::flock(descriptor, operation);
    } while (lock_status != 0 && errno == EINTR);
    return lock_status == 0;
}

// Returns 0, or the errno of the failed read.
int read_all(int descriptor, std::string &sink) {
    char buffer[8192];
    while (true) {
        ssize_t count = ::read(descriptor, buffer, sizeof(buffer));
        if (count > 0) {
            sink.append(buffer, static_cast<size_t>(count));
        } else if (count == 0) {
            return 0;
        } else if (errno != EINTR) {
            return errno;
        }
    }
}

bool write_all(int descriptor, const std::string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t count = ::write(descriptor, data.data() + offset, data.size() - offset);
        if (count > 0) {
            offset += static_cast<size_t>(count);
        } else if (count < 0 && errno != EINTR) {
            return false;
        }
    }
    return true;
}

} // namespace

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> environment;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string line(*entry);
        size_t separator = line.find('=');
        if (separator == std::string::npos || separator == 0) {
            continue;
        }
        environment[line.substr(0, separator)] = line.substr(separator + 1);
    }
    return environment;
}

ExecutionResult execute(const ExecutionRequest &request) {
    if (request.arguments.empty() || request.arguments.front().empty()) {
        return launch_failure_result("Empty command line");
    }

    const std::string &program = request.arguments.front();
    debug_log::log("exec: " + program + " (" + std::to_string(request.arguments.size() - 1) +
                   " argument(s), timeout " + std::to_string(request.timeout.count()) + "s)");

    // Everything the child touches is prepared before fork(): after fork only
    // async-signal-safe calls are made.
    std::vector<std::string> argv_strings = request.arguments;
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings;
    std::vector<char *> environment_pointers;
    if (request.environment) {
        for (const auto &entry : *request.environment) {
            environment_strings.push_back(entry.first + "=" + entry.second);
        }
        for (auto &environment_string : environment_strings) {
            environment_pointers.push_back(environment_string.data());
        }
        environment_pointers.push_back(nullptr);
    }

    const char *working_directory =
        request.working_directory.empty() ? nullptr : request.working_directory.c_str();

    int stdout_pipe[2];
    int stderr_pipe[2];
    int error_pipe[2];
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return launch_failure_result("pipe failed: " + std::string(std::strerror(errno)));
    }
    FileDescriptor stdout_read(stdout_pipe[0]);
    FileDescriptor stdout_write(stdout_pipe[1]);
    if (::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        return launch_failure_result("pipe failed: " + std::string(std::strerror(errno)));
    }
    FileDescriptor stderr_read(stderr_pipe[0]);
    FileDescriptor stderr_write(stderr_pipe[1]);
    if (::pipe2(error_pipe, O_CLOEXEC) != 0) {
        return launch_failure_result("pipe failed: " + std::string(std::strerror(errno)));
    }
    FileDescriptor error_read(error_pipe[0]);
    FileDescriptor error_write(error_pipe[1]);

    // The child must never read the MCP messages arriving on our stdin.
    FileDescriptor null_input(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (null_input.value < 0) {
        return launch_failure_result("open /dev/null failed: " + std::string(std::strerror(errno)));
    }

    pid_t child_pid = ::fork();
    if (child_pid < 0) {
        return launch_failure_result("fork failed: " + std::string(std::strerror(errno)));
    }

    if (child_pid == 0) {
        // New process group so a timeout can kill the whole tree.
        ::setpgid(0, 0);
        ::dup2(null_input.value, STDIN_FILENO);
        ::dup2(stdout_write.value, STDOUT_FILENO);
        ::dup2(stderr_write.value, STDERR_FILENO);

        LaunchFailure failure{0, 0};
        if (working_directory != nullptr && ::chdir(working_directory) != 0) {
            failure.error_number = errno;
            failure.failed_at_chdir = 1;
        } else {
            if (request.environment) {
                ::execvpe(argv_pointers[0], argv_pointers.data(), environment_pointers.data());
            } else {
                ::execvp(argv_pointers[0], argv_pointers.data());
            }
            failure.error_number = errno;
        }
        ssize_t written = ::write(error_write.value, &failure, sizeof(failure));
        (void)written;
        ::_exit(127);
    }

    // Parent.
    ::setpgid(child_pid, child_pid); // mirror the child's setpgid (race safety)
    stdout_write.reset();
    stderr_write.reset();
    error_write.reset();
    null_input.reset();

    // The error pipe closes on a successful exec; otherwise it carries errno.
    LaunchFailure failure{0, 0};
    ssize_t failure_bytes;
    do {
        failure_bytes = ::read(error_read.value, &failure, sizeof(failure));
    } while (failure_bytes < 0 && errno == EINTR);
    error_read.reset();

    if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int wait_status = 0;
        wait_for_child(child_pid, wait_status, 0);
        const std::string &subject = failure.failed_at_chdir ? request.working_directory : program;
        debug_log::log("exec: launch failed for " + program + ": " + std::strerror(failure.error_number));
        return launch_failure_result(describe_errno(failure.error_number, subject));
    }

    set_nonblocking(stdout_read.value);
    set_nonblocking(stderr_read.value);

    const std::chrono::seconds timeout = std::min(request.timeout, MAX_EXECUTION_TIMEOUT);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string captured_stdout;
    std::string captured_stderr;
    bool timed_out = false;
    bool reaped = false;
    int wait_status = 0;

    // Runs until the child has exited and both pipes reached EOF. Background
    // jobs that inherited the pipes keep the call open up to the deadline.
    while (true) {
        if (!reaped && wait_for_child(child_pid, wait_status, WNOHANG) == child_pid) {
            reaped = true;
        }

        nfds_t open_count = (stdout_read.value >= 0 ? 1 : 0) + (stderr_read.value >= 0 ? 1 : 0);
        if (reaped && open_count == 0) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        int poll_milliseconds = static_cast<int>(std::min<long long>(remaining.count(), 100));

        if (open_count == 0) {
            // Both streams closed but the child has not exited yet.
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(poll_milliseconds, 10)));
            continue;
        }

        struct pollfd poll_entries[2];
        nfds_t poll_count = 0;
        if (stdout_read.value >= 0) {
            poll_entries[poll_count++] = {stdout_read.value, POLLIN, 0};
        }
        if (stderr_read.value >= 0) {
            poll_entries[poll_count++] = {stderr_read.value, POLLIN, 0};
        }

        int ready = ::poll(poll_entries, poll_count, poll_milliseconds);
        if (ready < 0 && errno != EINTR) {
            break;
        }
        if (ready <= 0) {
            continue;
        }

        for (nfds_t index = 0; index < poll_count; ++index) {
            if (poll_entries[index].revents == 0) {
                continue;
            }
            if (poll_entries[index].fd == stdout_read.value) {
                drain_available(stdout_read, captured_stdout);
            } else if (poll_entries[index].fd == stderr_read.value) {
                drain_available(stderr_read, captured_stderr);
            }
        }
    }

    if (timed_out || !reaped) {
        // Neither the child nor anything it left in its group may outlive
        // this call. The group id stays valid while any member is alive.
        ::killpg(child_pid, SIGKILL);
    }
    if (!reaped) {
        ::kill(child_pid, SIGKILL);
        wait_for_child(child_pid, wait_status, 0);
    }

    ExecutionResult result;
    if (timed_out) {
        result.stderr_text = "Command timed out after " + std::to_string(timeout.count()) + "s";
        result.exit_status = EXIT_STATUS_SENTINEL;
        result.succeeded = false;
        result.timed_out = true;
        debug_log::log("exec: " + program + " timed out, process group killed");
        return result;
    }

    result.stdout_text = trim_trailing_whitespace(captured_stdout);
    result.stderr_text = trim_trailing_whitespace(captured_stderr);
    result.exit_status = decode_wait_status(wait_status);
    result.succeeded = (result.exit_status == 0);
    debug_log::log("exec: " + program + " exited with status " + std::to_string(result.exit_status));
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool read_file_locked(const std::string &file_path, std::string &output_contents) {
    // A missing lock file means no update has run yet; the plain read is then
    // as good as a locked one, since updates only ever rename a whole file in.
    std::string target_path = file_path;
    if (char *resolved = ::realpath(file_path.c_str(), nullptr)) {
        target_path = resolved;
        std::free(resolved);
    }
    FileDescriptor lock_file(::open(lock_path_for(target_path).c_str(), O_RDONLY | O_CLOEXEC));
    if (lock_file.value >= 0 && !lock_descriptor(lock_file.value, LOCK_SH)) {
        return false;
    }

    FileDescriptor file(::open(target_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.value < 0) {
        return false;
    }
    std::string contents;
    if (read_all(file.value, contents) != 0) {
        return false;
    }
    output_contents = std::move(contents);
    return true;
}

FileUpdateResult update_file_locked(const std::string &file_path, const FileTransform &transform) {
    FileUpdateResult result;

    // Resolve symlinks so the rename replaces the real file, not the link.
    char *resolved = ::realpath(file_path.c_str(), nullptr);
    if (resolved == nullptr) {
        result.status = (errno == ENOENT) ? FileUpdateStatus::not_found : FileUpdateStatus::io_error;
        result.error_message = std::strerror(errno);
        return result;
    }
    const std::string target_path(resolved);
    std::free(resolved);

    // Writers serialize on a sibling lock file: the target itself is replaced
    // by rename, so a lock on its inode would not outlive the first update.
    FileDescriptor lock_file(::open(lock_path_for(target_path).c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
    if (lock_file.value < 0) {
        result.error_message = "cannot open lock file: " + std::string(std::strerror(errno));
        return result;
    }
    if (!lock_descriptor(lock_file.value, LOCK_EX)) {
        result.error_message = "flock failed: " + std::string(std::strerror(errno));
        return result;
    }

    FileDescriptor file(::open(target_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.value < 0) {
        result.status = (errno == ENOENT) ? FileUpdateStatus::not_found : FileUpdateStatus::io_error;
        result.error_message = std::strerror(errno);
        return result;
    }
    struct stat file_status;
    if (::fstat(file.value, &file_status) != 0) {
        result.error_message = "stat failed: " + std::string(std::strerror(errno));
        return result;
    }
    std::string contents;
    int read_error = read_all(file.value, contents);
    if (read_error != 0) {
        result.error_message = "read failed: " + std::string(std::strerror(read_error));
        return result;
    }
    file.reset();

    std::optional<std::string> replacement = transform(contents);
    if (!replacement || *replacement == contents) {
        result.status = FileUpdateStatus::unchanged;
        return result;
    }

    // Readers see either the old file or the new one, never a partial write.
    // On any failure the original stays in place.
    std::string temporary_path = target_path + ".XXXXXX";
    FileDescriptor temporary(::mkostemp(&temporary_path[0], O_CLOEXEC));
    if (temporary.value < 0) {
        result.error_message = "cannot create temporary file: " + std::string(std::strerror(errno));
        return result;
    }

    std::string failure;
    if (::fchmod(temporary.value, file_status.st_mode & 07777) != 0) {
        failure = "chmod failed: ";
    } else if (!write_all(temporary.value, *replacement)) {
        failure = "write failed: ";
    } else if (::fsync(temporary.value) != 0) {
        failure = "fsync failed: ";
    }
    if (failure.empty()) {
        temporary.reset();
        if (::rename(temporary_path.c_str(), target_path.c_str()) != 0) {
            failure = "rename failed: ";
        }
    }
    if (!failure.empty()) {
        result.error_message = failure + std::strerror(errno);
        ::unlink(temporary_path.c_str());
        return result;
    }

    result.status = FileUpdateStatus::updated;
    return result;
}

} // namespace platform

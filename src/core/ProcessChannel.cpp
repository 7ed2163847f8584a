/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ProcessChannel.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <set>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace Amortize {
namespace ProcessChannel {

namespace {

// Parent ends of all live channels, closed in every new child
std::mutex s_channelMutex;
std::set<int> s_parentFds;

bool writeAll(int fd, const char* data, size_t length) {
    while (length > 0) {
        // MSG_NOSIGNAL: a dead peer reports EPIPE instead of raising SIGPIPE
        ssize_t written = ::send(fd, data, length, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        length -= static_cast<size_t>(written);
    }
    return true;
}

bool readAll(int fd, char* data, size_t length) {
    while (length > 0) {
        ssize_t got = ::read(fd, data, length);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (got == 0) {
            return false;
        }
        data += got;
        length -= static_cast<size_t>(got);
    }
    return true;
}

} // anonymous namespace

bool writeFrame(int fd, FrameStatus status, std::string_view payload) {
    if (payload.size() > MAX_FRAME_BYTES) {
        return false;
    }

    char header[5];
    const uint32_t length = static_cast<uint32_t>(payload.size());
    std::memcpy(header, &length, sizeof(length));
    header[4] = static_cast<char>(status);

    return writeAll(fd, header, sizeof(header)) &&
           writeAll(fd, payload.data(), payload.size());
}

bool readFrame(int fd, FrameStatus& status, std::string& payload) {
    char header[5];
    if (!readAll(fd, header, sizeof(header))) {
        return false;
    }

    uint32_t length = 0;
    std::memcpy(&length, header, sizeof(length));
    if (length > MAX_FRAME_BYTES) {
        return false;
    }
    status = static_cast<FrameStatus>(static_cast<uint8_t>(header[4]));

    payload.resize(length);
    return length == 0 || readAll(fd, payload.data(), length);
}

ChildProcess spawnWorker(const std::function<int(int fd)>& body) {
    // Held across fork so the child's copy of the registry is complete
    std::lock_guard<std::mutex> lock(s_channelMutex);

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw WorkerProcessError(std::format("socketpair failed: {}", std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw WorkerProcessError(std::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child: no logging here, the logger mutex may have been held at fork
#ifdef __linux__
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        ::close(fds[0]);
        for (int fd : s_parentFds) {
            ::close(fd);
        }
        int code = body(fds[1]);
        ::close(fds[1]);
        ::_exit(code);
    }

    ::close(fds[1]);
    s_parentFds.insert(fds[0]);
    WORKER_DEBUG(std::format("Spawned worker process {}", pid));
    return ChildProcess{pid, fds[0]};
}

void closeChannel(ChildProcess& child) {
    if (child.fd >= 0) {
        std::lock_guard<std::mutex> lock(s_channelMutex);
        s_parentFds.erase(child.fd);
        ::close(child.fd);
        child.fd = -1;
    }
}

void reap(ChildProcess& child, bool kill) {
    if (child.pid <= 0) {
        return;
    }
    if (kill) {
        ::kill(child.pid, SIGKILL);
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(child.pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == child.pid && WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        WORKER_WARN(std::format("Worker process {} exited with status {}", child.pid,
                                WEXITSTATUS(status)));
    }
    child.pid = -1;
}

} // namespace ProcessChannel
} // namespace Amortize

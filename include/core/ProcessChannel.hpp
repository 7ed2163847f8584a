/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROCESS_CHANNEL_HPP
#define PROCESS_CHANNEL_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace Amortize {
namespace ProcessChannel {

// Frame layout: [u32 payload length][u8 status][payload]
enum class FrameStatus : uint8_t { Ok = 0, TaskFailed = 1, Undecodable = 2 };

// Frames above this size are rejected as corrupt
constexpr uint32_t MAX_FRAME_BYTES = 1u << 30;

bool writeFrame(int fd, FrameStatus status, std::string_view payload);

// Returns false on EOF, I/O error or an oversized length prefix
bool readFrame(int fd, FrameStatus& status, std::string& payload);

struct ChildProcess {
    pid_t pid{-1};
    int fd{-1};  // parent end of the socket pair
};

/**
 * @brief Fork a worker that runs body(fd) and exits
 *
 * The child first closes the parent end of every channel still open in
 * this process, so each worker sees EOF as soon as the parent closes its
 * own channel. The child never returns into the caller's stack; it leaves
 * through _exit().
 * @throws WorkerProcessError if the socket pair or fork fails
 */
ChildProcess spawnWorker(const std::function<int(int fd)>& body);

void closeChannel(ChildProcess& child);

// Blocks until the child is reaped; sends SIGKILL first when kill is set
void reap(ChildProcess& child, bool kill);

} // namespace ProcessChannel
} // namespace Amortize

#endif // PROCESS_CHANNEL_HPP

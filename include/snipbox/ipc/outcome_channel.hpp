/**
 * @file outcome_channel.hpp
 * @brief One-shot pipe between a worker and its supervisor
 *
 * The worker writes exactly one framed message; the supervisor reads at most
 * one, bounded by a deadline. Frames are an 8-byte little-endian length
 * followed by the payload bytes.
 *
 * ```
 * supervisor (read end)  <──── pipe ────  worker (write end)
 *      Receive(deadline)                      Send(payload)  x1
 * ```
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace snipbox {
namespace ipc {

/// Upper bound on a single message; larger frames are treated as corrupt
constexpr std::size_t kMaxMessageBytes = 256u * 1024u * 1024u;

/**
 * @enum ReceiveStatus
 * @brief How a bounded receive ended
 */
enum class ReceiveStatus {
    MESSAGE,    ///< A complete frame was read
    CLOSED,     ///< The write end closed before a complete frame arrived
    DEADLINE    ///< The deadline passed first
};

/**
 * @struct ReceiveResult
 * @brief Status plus payload (payload only meaningful for MESSAGE)
 */
struct ReceiveResult {
    ReceiveStatus status{ReceiveStatus::CLOSED};
    std::string payload;
    std::string error;          ///< Reason for CLOSED when the frame was corrupt
};

/**
 * @class OutcomeChannel
 * @brief Single-producer, single-consumer, single-use message pipe
 *
 * Created by the supervisor before fork; the parent closes the write end,
 * the child closes the read end. Both descriptors are close-on-exec.
 *
 * **Usage Example**:
 * @code
 * OutcomeChannel channel;
 * pid_t pid = fork();
 * if (pid == 0) {
 *     channel.CloseReadEnd();
 *     channel.Send(R"({"ok":true})");
 *     _exit(0);
 * }
 * channel.CloseWriteEnd();
 * auto received = channel.Receive(std::chrono::steady_clock::now() + std::chrono::seconds(8));
 * @endcode
 */
class OutcomeChannel {
public:
    /**
     * @brief Create the pipe
     * @throws std::system_error if the pipe cannot be created
     */
    OutcomeChannel();

    ~OutcomeChannel();

    OutcomeChannel(const OutcomeChannel&) = delete;
    OutcomeChannel& operator=(const OutcomeChannel&) = delete;

    void CloseReadEnd();
    void CloseWriteEnd();

    /// Write descriptor, -1 once closed (kept open by the worker's fd sweep)
    int GetWriteFd() const { return write_fd_; }

    /**
     * @brief Write the one and only message
     *
     * @param payload Message bytes
     * @return true if the whole frame was written
     *
     * @throws std::logic_error if called a second time
     */
    bool Send(const std::string& payload);

    /**
     * @brief Wait for the message until @p deadline
     *
     * Reads nothing once the deadline has passed, so a message that arrives
     * late is never observed.
     *
     * @param deadline Absolute deadline
     * @return MESSAGE with payload, CLOSED, or DEADLINE
     */
    ReceiveResult Receive(std::chrono::steady_clock::time_point deadline);

private:
    int read_fd_{-1};
    int write_fd_{-1};
    bool sent_{false};
};

} // namespace ipc
} // namespace snipbox

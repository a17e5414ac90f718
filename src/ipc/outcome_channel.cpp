/**
 * @file outcome_channel.cpp
 * @brief Implementation of the one-shot worker pipe
 *
 * @date 2025
 */

#include "snipbox/ipc/outcome_channel.hpp"

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace snipbox {
namespace ipc {

namespace {

constexpr std::size_t kHeaderBytes = 8;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool WriteAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

std::uint64_t DecodeLength(const std::string& buffer) {
    std::uint64_t length = 0;
    for (std::size_t i = 0; i < kHeaderBytes; ++i) {
        length |= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i])) << (8 * i);
    }
    return length;
}

} // anonymous namespace

OutcomeChannel::OutcomeChannel() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
}

OutcomeChannel::~OutcomeChannel() {
    CloseFd(read_fd_);
    CloseFd(write_fd_);
}

void OutcomeChannel::CloseReadEnd() {
    CloseFd(read_fd_);
}

void OutcomeChannel::CloseWriteEnd() {
    CloseFd(write_fd_);
}

bool OutcomeChannel::Send(const std::string& payload) {
    if (sent_) {
        throw std::logic_error("outcome channel already carried its message");
    }
    sent_ = true;

    if (write_fd_ < 0) {
        return false;
    }

    char header[kHeaderBytes];
    const auto length = static_cast<std::uint64_t>(payload.size());
    for (std::size_t i = 0; i < kHeaderBytes; ++i) {
        header[i] = static_cast<char>((length >> (8 * i)) & 0xFF);
    }

    const bool ok = WriteAll(write_fd_, header, kHeaderBytes) &&
                    WriteAll(write_fd_, payload.data(), payload.size());
    CloseFd(write_fd_);
    return ok;
}

ReceiveResult OutcomeChannel::Receive(std::chrono::steady_clock::time_point deadline) {
    ReceiveResult result;
    if (read_fd_ < 0) {
        result.status = ReceiveStatus::CLOSED;
        return result;
    }

    std::string buffer;
    std::uint64_t expected = 0;
    bool have_header = false;
    char chunk[64 * 1024];

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.status = ReceiveStatus::DEADLINE;
            return result;
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        struct pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining > 0 ? remaining : 1));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.status = ReceiveStatus::CLOSED;
            result.error = std::system_category().message(errno);
            return result;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.status = ReceiveStatus::CLOSED;
            result.error = std::system_category().message(errno);
            return result;
        }
        if (n == 0) {
            result.status = ReceiveStatus::CLOSED;
            if (!buffer.empty()) {
                result.error = "truncated frame";
            }
            return result;
        }

        buffer.append(chunk, static_cast<std::size_t>(n));

        if (!have_header && buffer.size() >= kHeaderBytes) {
            expected = DecodeLength(buffer);
            have_header = true;
            if (expected > kMaxMessageBytes) {
                result.status = ReceiveStatus::CLOSED;
                result.error = "frame exceeds maximum message size";
                return result;
            }
        }

        if (have_header && buffer.size() >= kHeaderBytes + expected) {
            result.status = ReceiveStatus::MESSAGE;
            result.payload = buffer.substr(kHeaderBytes, static_cast<std::size_t>(expected));
            CloseFd(read_fd_);
            return result;
        }
    }
}

} // namespace ipc
} // namespace snipbox

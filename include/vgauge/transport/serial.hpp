#pragma once

#include <iostream>
#include <string>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/channel.hpp"

namespace vgauge {

class SerialPort : public ByteChannel
{
public:

    SerialPort() : fd_(-1), slave_fd_(-1), baud_(Protocol::DEFAULT_BAUD), open_(false) {}
    ~SerialPort() override
    {
        close();
    }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    Result<bool> open(const std::string& port, int baud = Protocol::DEFAULT_BAUD);

    // Pseudo-terminal master; the returned slave path can be opened by a peer.
    Result<std::string> open_virtual();

    Result<bool> close();
    Result<size_t> write(const uint8_t* data, size_t len) override;
    Result<std::vector<uint8_t>> read(int timeout_ms) override;

    bool is_open() const;
    std::string get_port() const;
    int get_baud() const;

private:

    int fd_;
    int slave_fd_;
    std::string port_;
    int baud_;
    struct termios original_tty_{};
    bool open_;

    Result<bool> configure(int fd, int baud);
};

} // namespace vgauge

#include "transport/serial.hpp"
#include <poll.h>
#include <chrono>
#include <cstdlib>

namespace vgauge {

namespace {
    bool to_speed(int baud, speed_t& speed)
    {
        switch (baud) {
            case 1200: speed = B1200; return true;
            case 2400: speed = B2400; return true;
            case 4800: speed = B4800; return true;
            case 9600: speed = B9600; return true;
            case 19200: speed = B19200; return true;
            case 38400: speed = B38400; return true;
            case 57600: speed = B57600; return true;
            case 115200: speed = B115200; return true;
            case 230400: speed = B230400; return true;
            default: return false;
        }
    }

    int elapsed_ms(std::chrono::steady_clock::time_point since)
    {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - since).count());
    }
}

Result<bool> SerialPort::configure(int fd, int baud)
{
    speed_t speed;
    if (!to_speed(baud, speed))
    {
        std::cerr << "Unsupported baud rate " << baud << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    struct termios tty;
    if(tcgetattr(fd, &tty) != 0)
    {
        std::cerr << "Error getting port attributes: " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    cfmakeraw(&tty);

    // 8N1
    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag |= CREAD | CLOCAL;

    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if(tcsetattr(fd, TCSANOW, &tty) != 0)
    {
        std::cerr << "Error setting port attributes: " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }
    return Result<bool>::success(true);
}

Result<bool> SerialPort::open(const std::string& port, int baud)
{
    if (open_) {
        close();
    }
    port_ = port;

    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY);
    if(fd_ < 0)
    {
        std::cerr << "Error opening " << port << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if(tcgetattr(fd_, &original_tty_) != 0)
    {
        std::cerr << "Error getting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    auto configured = configure(fd_, baud);
    if (!configured.ok())
    {
        ::close(fd_);
        fd_ = -1;
        return configured;
    }

    tcflush(fd_, TCIOFLUSH);
    baud_ = baud;
    open_ = true;
    return Result<bool>::success(true);
}

Result<std::string> SerialPort::open_virtual()
{
    if (open_) {
        close();
    }

    fd_ = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (fd_ < 0)
    {
        std::cerr << "Error opening pseudo-terminal: " << strerror(errno) << "\n";
        return Result<std::string>::failure(Error::PORT_ERROR);
    }

    char name[128];
    if (::grantpt(fd_) != 0 || ::unlockpt(fd_) != 0 || ::ptsname_r(fd_, name, sizeof(name)) != 0)
    {
        std::cerr << "Error preparing pseudo-terminal: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<std::string>::failure(Error::PORT_ERROR);
    }

    // holding the slave open keeps the master from seeing a hangup before the peer attaches
    slave_fd_ = ::open(name, O_RDWR | O_NOCTTY);
    if (slave_fd_ < 0 || !configure(slave_fd_, baud_).ok())
    {
        std::cerr << "Error opening " << name << ": " << strerror(errno) << "\n";
        if (slave_fd_ >= 0) {
            ::close(slave_fd_);
            slave_fd_ = -1;
        }
        ::close(fd_);
        fd_ = -1;
        return Result<std::string>::failure(Error::PORT_ERROR);
    }

    port_ = name;
    open_ = true;
    return Result<std::string>::success(port_);
}

Result<bool> SerialPort::close()
{
    if(fd_ >= 0)
    {
        if (slave_fd_ >= 0) {
            ::close(slave_fd_);
            slave_fd_ = -1;
        } else {
            tcsetattr(fd_, TCSANOW, &original_tty_);
        }
        ::close(fd_);
        fd_ = -1;
        open_ = false;
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

Result<size_t> SerialPort::write(const uint8_t* data, size_t len)
{
    if(fd_ < 0)
        return Result<size_t>::failure(Error::PORT_ERROR);

    size_t total = 0;
    while (total < len)
    {
        ssize_t written = ::write(fd_, data + total, len - total);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            std::cerr << "Error writing " << port_ << ": " << strerror(errno) << "\n";
            return Result<size_t>::failure(Error::WRITE_ERROR);
        }
        total += static_cast<size_t>(written);
    }

    tcdrain(fd_);
    return Result<size_t>::success(total);
}

Result<std::vector<uint8_t>> SerialPort::read(int timeout_ms)
{
    std::vector<uint8_t> buffer;

    if (fd_ < 0)
        return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);

    uint8_t temp[256];
    auto start = std::chrono::steady_clock::now();
    auto last_data = start;

    while (true)
    {
        // a reply is complete once the line goes quiet
        if (buffer.empty() ? elapsed_ms(start) >= timeout_ms
                           : elapsed_ms(last_data) >= Protocol::INTER_BYTE_GAP_MS)
            break;

        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, 10);

        if (ret > 0 && (pfd.revents & POLLIN))
        {
            ssize_t n = ::read(fd_, temp, sizeof(temp));
            if (n > 0)
            {
                buffer.insert(buffer.end(), temp, temp + n);
                last_data = std::chrono::steady_clock::now();
            }
            else if (n < 0 && errno != EAGAIN && errno != EINTR)
            {
                std::cerr << "Error reading " << port_ << ": " << strerror(errno) << "\n";
                return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
            }
        }
        else if (ret > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)))
        {
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
        }
        else if (ret < 0 && errno != EINTR)
        {
            return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);
        }
    }

    if (buffer.empty()) {
        return Result<std::vector<uint8_t>>::failure(Error::TIMEOUT);
    }

    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

bool SerialPort::is_open() const
{
    return open_;
}

std::string SerialPort::get_port() const
{
    return port_;
}

int SerialPort::get_baud() const
{
    return baud_;
}

} // namespace vgauge

#include "nabunet/platform/channel_factory.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>

#include "nabunet/core/logging.h"
#include "nabunet/io/core/channel.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <termios.h>

#if defined(__linux__)
    #include <pty.h>
#elif defined(__APPLE__)
    #include <util.h>
#else
    #include <pty.h>
#endif

namespace nabunet::platform {

static constexpr const char* TAG = "channel";

// Blocking fd channel. close() only writes to a pipe, so it is safe to call
// from a signal handler to unblock read().
class FdChannel : public nabunet::io::Channel {
public:
    explicit FdChannel(int fd)
        : _fd(fd)
    {
        if (::pipe(_wake) != 0) {
            _wake[0] = _wake[1] = -1;
            NN_LOGW(TAG, "pipe() failed: %s; close() will not unblock reads", std::strerror(errno));
        }
    }

    ~FdChannel() override {
        if (_fd >= 0) ::close(_fd);
        if (_wake[0] >= 0) ::close(_wake[0]);
        if (_wake[1] >= 0) ::close(_wake[1]);
    }

    std::size_t read(std::uint8_t* buffer, std::size_t maxLen) override {
        while (!_closed.load()) {
            struct pollfd pfd[2];
            pfd[0].fd = _fd;
            pfd[0].events = POLLIN;
            pfd[0].revents = 0;
            pfd[1].fd = _wake[0];
            pfd[1].events = POLLIN;
            pfd[1].revents = 0;

            int ret = ::poll(pfd, 2, -1);
            if (ret < 0) {
                if (errno == EINTR) continue;
                NN_LOGE(TAG, "poll failed: %s", std::strerror(errno));
                break;
            }
            if (pfd[1].revents != 0) {
                break;
            }
            if ((pfd[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            ssize_t n = ::read(_fd, buffer, maxLen);
            if (n > 0) {
                return static_cast<std::size_t>(n);
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            NN_LOGI(TAG, "device closed (%s)", n == 0 ? "eof" : std::strerror(errno));
            break;
        }
        _closed.store(true);
        return 0;
    }

    void write(const std::uint8_t* buffer, std::size_t len) override {
        const std::uint8_t* ptr = buffer;
        std::size_t remaining = len;

        while (remaining > 0 && !_closed.load()) {
            ssize_t n = ::write(_fd, ptr, remaining);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                NN_LOGE(TAG, "write failed: %s", std::strerror(errno));
                close();
                return;
            }
            remaining -= static_cast<std::size_t>(n);
            ptr       += n;
        }
    }

    void close() override {
        _closed.store(true);
        if (_wake[1] >= 0) {
            const char b = 1;
            (void)!::write(_wake[1], &b, 1);
        }
    }

private:
    int _fd;
    int _wake[2]{-1, -1};
    std::atomic<bool> _closed{false};
};

// Keeps the slave end open so the master does not report hangup before an
// emulator attaches.
class PtyChannel final : public FdChannel {
public:
    PtyChannel(int masterFd, int slaveFd)
        : FdChannel(masterFd)
        , _slaveFd(slaveFd)
    {}

    ~PtyChannel() override {
        if (_slaveFd >= 0) ::close(_slaveFd);
    }

private:
    int _slaveFd;
};

static bool baud_to_speed(std::uint32_t baud, speed_t& out)
{
    switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
    }
}

// 8 data bits, no parity, 2 stop bits, raw.
static bool configure_tty(int fd, std::uint32_t baud)
{
    speed_t speed{};
    if (!baud_to_speed(baud, speed)) {
        NN_LOGE(TAG, "unsupported baud rate %u", static_cast<unsigned>(baud));
        return false;
    }

    struct termios tio;
    if (::tcgetattr(fd, &tio) != 0) {
        NN_LOGE(TAG, "tcgetattr failed: %s", std::strerror(errno));
        return false;
    }

    ::cfmakeraw(&tio);
    tio.c_cflag &= ~(PARENB | CSIZE | CRTSCTS);
    tio.c_cflag |= CS8 | CSTOPB | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    tio.c_cc[VMIN]  = 1;
    tio.c_cc[VTIME] = 0;

    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
        NN_LOGE(TAG, "tcsetattr failed: %s", std::strerror(errno));
        return false;
    }
    ::tcflush(fd, TCIOFLUSH);
    return true;
}

static std::unique_ptr<nabunet::io::Channel> create_tty_channel(const config::SerialConfig& config)
{
    int fd = ::open(config.device.c_str(), O_RDWR | O_NOCTTY);
    if (fd < 0) {
        NN_LOGE(TAG, "cannot open %s: %s", config.device.c_str(), std::strerror(errno));
        return nullptr;
    }
    if (!configure_tty(fd, config.baudRate)) {
        ::close(fd);
        return nullptr;
    }

    NN_LOGI(TAG, "using %s at %u baud, 8N2", config.device.c_str(),
            static_cast<unsigned>(config.baudRate));
    return std::make_unique<FdChannel>(fd);
}

static std::unique_ptr<nabunet::io::Channel> create_pty_channel()
{
    int masterFd = -1;
    int slaveFd  = -1;
    char slaveName[256] = {0};

    if (::openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr) != 0) {
        NN_LOGE(TAG, "openpty failed: %s", std::strerror(errno));
        return nullptr;
    }

    struct termios tio;
    if (::tcgetattr(slaveFd, &tio) == 0) {
        ::cfmakeraw(&tio);
        (void)::tcsetattr(slaveFd, TCSANOW, &tio);
    }

    NN_LOGI(TAG, "created PTY; connect the emulator to %s", slaveName);

    return std::make_unique<PtyChannel>(masterFd, slaveFd);
}

std::unique_ptr<nabunet::io::Channel>
create_channel(const config::SerialConfig& config)
{
    switch (config.kind) {
    case config::ChannelKind::Tty:
        return create_tty_channel(config);

    case config::ChannelKind::Pty:
        return create_pty_channel();

    case config::ChannelKind::Unknown:
        break;
    }

    NN_LOGE(TAG, "unknown channel kind");
    return nullptr;
}

} // namespace nabunet::platform

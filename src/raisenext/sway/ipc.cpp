#include "sway/ipc.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::~SwayIpc() {
    if (fd_ >= 0) ::close(fd_);
}

std::expected<void, std::string> SwayIpc::connect(const std::string& socket_path) {
    if (socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
        return std::unexpected("socket path too long: " + socket_path);
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::unexpected(std::string("socket() failed: ") + std::strerror(errno));

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size());

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected("connect " + socket_path + " failed: " + std::strerror(err));
    }

    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
    return {};
}

std::string SwayIpc::encode(uint32_t type, const std::string& payload) {
    auto len = static_cast<uint32_t>(payload.size());
    std::string msg(HEADER_LEN, '\0');
    std::memcpy(msg.data(), MAGIC, MAGIC_LEN);
    std::memcpy(msg.data() + MAGIC_LEN, &len, sizeof(len));
    std::memcpy(msg.data() + MAGIC_LEN + sizeof(len), &type, sizeof(type));
    msg += payload;
    return msg;
}

std::expected<uint32_t, std::string> SwayIpc::decode_length(const char* header) {
    if (std::memcmp(header, MAGIC, MAGIC_LEN) != 0) {
        return std::unexpected(std::string("bad reply magic"));
    }
    uint32_t len;
    std::memcpy(&len, header + MAGIC_LEN, sizeof(len));
    return len;
}

std::expected<std::string, std::string> SwayIpc::request(Message type, const std::string& payload) {
    if (fd_ < 0) return std::unexpected(std::string("not connected"));

    auto msg = encode(static_cast<uint32_t>(type), payload);
    if (!write_all(msg.data(), msg.size())) {
        return std::unexpected(std::string("send failed: ") + std::strerror(errno));
    }

    char header[HEADER_LEN];
    if (!read_exact(header, HEADER_LEN)) return std::unexpected(std::string("connection closed"));

    auto len = decode_length(header);
    if (!len) return std::unexpected(len.error());

    std::string reply(*len, '\0');
    if (!read_exact(reply.data(), reply.size())) {
        return std::unexpected(std::string("truncated reply"));
    }
    return reply;
}

bool SwayIpc::write_all(const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool SwayIpc::read_exact(char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::recv(fd_, data, len, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

#pragma once

#include <cstdint>
#include <expected>
#include <string>

// One blocking i3-ipc connection (Sway speaks the same protocol).
class SwayIpc {
public:
    enum class Message : uint32_t {
        RunCommand = 0,
        GetTree = 4,
    };

    SwayIpc() = default;
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    std::expected<void, std::string> connect(const std::string& socket_path);
    bool connected() const { return fd_ >= 0; }

    // Send one message and wait for its reply payload.
    std::expected<std::string, std::string> request(Message type, const std::string& payload = "");

    // Header: magic, payload length, message type (both native-endian u32).
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t MAGIC_LEN = sizeof(MAGIC) - 1;
    static constexpr size_t HEADER_LEN = MAGIC_LEN + 2 * sizeof(uint32_t);

    static std::string encode(uint32_t type, const std::string& payload);
    // Payload length from a header, or an error if the magic is wrong.
    static std::expected<uint32_t, std::string> decode_length(const char* header);

private:
    bool write_all(const char* data, size_t len);
    bool read_exact(char* data, size_t len);

    int fd_ = -1;
};

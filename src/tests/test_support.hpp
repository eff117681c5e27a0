#pragma once

#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <fstream>
#include <iterator>
#include <functional>
#include <filesystem>
#include <stdexcept>

namespace testing {

// mkdtemp directory, removed with its contents on destruction
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "zipstage_test_XXXXXX").string();
        if (!::mkdtemp(pattern.data())) throw std::runtime_error("mkdtemp failed");
        path = std::filesystem::canonical(pattern);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path write(const std::string& name, std::string_view content) const {
        auto file = path / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }
};

inline std::string read_all(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Writes everything or gives up once the peer is gone
inline bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n <= 0) return false;
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

inline std::string response_head(int status, std::string_view reason, std::string_view extra_headers = {}) {
    std::string head = "HTTP/1.1 " + std::to_string(status) + " ";
    head += reason;
    head += "\r\nConnection: close\r\n";
    head += extra_headers;
    head += "\r\n";
    return head;
}

// HTTP/1.1 server on 127.0.0.1, one thread per connection. The handler
// receives the socket and the request path and writes the whole response.
class LoopbackServer {
public:
    using Handler = std::function<void(int fd, const std::string& path)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        running_ = true;
        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~LoopbackServer() {
        running_ = false;
        if (acceptor_.joinable()) acceptor_.join();
        ::close(listen_fd_);
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(std::string_view path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + std::string(path);
    }

    bool running() const { return running_; }

private:
    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptor_;
    std::mutex mutex_;
    std::vector<std::thread> workers_;

    void accept_loop() {
        while (running_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;
            std::lock_guard<std::mutex> lock(mutex_);
            workers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    void serve(int fd) {
        std::string request;
        char buf[4096];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request.append(buf, static_cast<size_t>(n));
        }
        // "GET /path HTTP/1.1"
        std::string path = "/";
        auto sp1 = request.find(' ');
        if (sp1 != std::string::npos) {
            auto sp2 = request.find(' ', sp1 + 1);
            if (sp2 != std::string::npos) path = request.substr(sp1 + 1, sp2 - sp1 - 1);
        }
        handler_(fd, path);
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
};

// Loopback requests must never go through a proxy from the environment
inline void bypass_proxies() {
    ::setenv("NO_PROXY", "127.0.0.1,localhost", 1);
    ::setenv("no_proxy", "127.0.0.1,localhost", 1);
}

} // namespace testing

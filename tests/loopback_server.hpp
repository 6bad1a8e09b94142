#ifndef LOOPBACK_SERVER_HPP
#define LOOPBACK_SERVER_HPP

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Hookstage {
namespace Testing {

struct RecordedRequest
{
    std::string method;
    std::string target; // Path as sent on the request line
    std::string body;
};

struct CannedResponse
{
    int status = 200;
    std::string body;
};

/**
 * Minimal HTTP/1.1 responder on 127.0.0.1 with an OS-assigned port. One
 * request per connection; responses are served in order and the last one
 * repeats.
 */
class LoopbackServer
{
public:
    explicit LoopbackServer(std::vector<CannedResponse> responses)
        : responses_(std::move(responses))
    {
        if (responses_.empty()) {
            responses_.push_back(CannedResponse());
        }

        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) {
            throw std::runtime_error("socket() failed");
        }

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listenFd_, 8) != 0) {
            ::close(listenFd_);
            throw std::runtime_error("Could not listen on 127.0.0.1");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer()
    {
        stopping_ = true;
        // Wakes the blocked accept()
        ::shutdown(listenFd_, SHUT_RDWR);
        thread_.join();
        ::close(listenFd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string endpoint() const
    {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    std::vector<RecordedRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve()
    {
        while (!stopping_) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                if (errno == EINTR && !stopping_) {
                    continue;
                }
                return;
            }
            handle(client);
            ::close(client);
        }
    }

    void handle(int client)
    {
        std::string data;
        char buffer[4096];
        size_t headerEnd = std::string::npos;
        while ((headerEnd = data.find("\r\n\r\n")) == std::string::npos) {
            ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            data.append(buffer, static_cast<size_t>(n));
        }

        RecordedRequest request;
        size_t contentLength = 0;
        bool expectContinue = false;

        std::istringstream head(data.substr(0, headerEnd));
        std::string line;
        std::getline(head, line);
        std::istringstream requestLine(line);
        requestLine >> request.method >> request.target;

        while (std::getline(head, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));

            if (name == "content-length") {
                contentLength = std::stoul(value);
            }
            else if (name == "expect") {
                expectContinue = true;
            }
        }

        if (expectContinue) {
            sendAll(client, "HTTP/1.1 100 Continue\r\n\r\n");
        }

        request.body = data.substr(headerEnd + 4);
        while (request.body.size() < contentLength) {
            ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            request.body.append(buffer, static_cast<size_t>(n));
        }

        CannedResponse response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            response = responses_[std::min(served_, responses_.size() - 1)];
            served_++;
        }

        std::string reply = "HTTP/1.1 " + std::to_string(response.status) + " " +
                            reasonPhrase(response.status) + "\r\n" +
                            "Content-Type: application/yaml\r\n" +
                            "Content-Length: " + std::to_string(response.body.size()) + "\r\n" +
                            "Connection: close\r\n\r\n" + response.body;
        sendAll(client, reply);
    }

    static void sendAll(int client, const std::string& payload)
    {
        size_t sent = 0;
        while (sent < payload.size()) {
            ssize_t n = ::send(client, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return;
            }
            sent += static_cast<size_t>(n);
        }
    }

    static const char* reasonPhrase(int status)
    {
        switch (status) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 404: return "Not Found";
            case 422: return "Unprocessable Entity";
            case 500: return "Internal Server Error";
            default:  return "Status";
        }
    }

    std::vector<CannedResponse> responses_;
    int listenFd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
    size_t served_ = 0;
};

} // namespace Testing
} // namespace Hookstage

#endif // LOOPBACK_SERVER_HPP

#include "niritaskbar/niri_socket.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace niritaskbar {

    namespace {

        constexpr std::string_view kContext = "niri socket";

        NiriErrorInfo              errno_error(std::string_view what) {
            std::string message(what);
            message.append(": ");
            message.append(std::strerror(errno));
            return NiriErrorInfo{std::string(kContext), message};
        }

    } // namespace

    NiriSocket::NiriSocket(ConnectedTag, FileDescriptor fd) : fd_(std::move(fd)) {}

    NiriResult<std::unique_ptr<NiriSocket>> NiriSocket::connect(const std::filesystem::path& socket_path) {
        FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (!fd) {
            return std::unexpected(errno_error("unable to create socket"));
        }

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        const auto path = socket_path.string();
        if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
            return std::unexpected(NiriErrorInfo{std::string(kContext), "invalid socket path: " + path});
        }
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            return std::unexpected(errno_error("unable to connect to " + path));
        }
        return std::make_unique<NiriSocket>(ConnectedTag{}, std::move(fd));
    }

    NiriResult<void> NiriSocket::send_line(std::string_view line) {
        std::string payload(line);
        payload.push_back('\n');
        size_t sent = 0;
        while (sent < payload.size()) {
            const ssize_t result = ::send(fd_.get(), payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
            if (result > 0) {
                sent += static_cast<size_t>(result);
                continue;
            }
            if (result < 0 && errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error("send failed"));
        }
        return {};
    }

    NiriResult<std::string> NiriSocket::read_line() {
        while (true) {
            const auto newline = buffer_.find('\n');
            if (newline != std::string::npos) {
                std::string line = buffer_.substr(0, newline);
                buffer_.erase(0, newline + 1);
                return line;
            }
            char          chunk[4096];
            const ssize_t result = ::recv(fd_.get(), chunk, sizeof(chunk), 0);
            if (result > 0) {
                buffer_.append(chunk, static_cast<size_t>(result));
                continue;
            }
            if (result == 0) {
                return std::unexpected(NiriErrorInfo{std::string(kContext), "connection closed"});
            }
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error("recv failed"));
        }
    }

    void NiriSocket::shutdown() {
        if (fd_) {
            ::shutdown(fd_.get(), SHUT_RDWR);
        }
    }

    NiriConnector socket_connector(std::filesystem::path socket_path) {
        return [socket_path = std::move(socket_path)]() -> NiriResult<std::unique_ptr<NiriTransport>> {
            auto socket = NiriSocket::connect(socket_path);
            if (!socket) {
                return std::unexpected(socket.error());
            }
            return std::unique_ptr<NiriTransport>(std::move(*socket));
        };
    }

    NiriClient::NiriClient(NiriConnector connector) : connector_(std::move(connector)) {}

    NiriResult<void> NiriClient::activate_window(uint64_t id) {
        const auto transport = request(focus_window_request(id));
        if (!transport) {
            return std::unexpected(transport.error());
        }
        return {};
    }

    NiriResult<std::unique_ptr<NiriTransport>> NiriClient::open_event_stream() {
        return request(event_stream_request());
    }

    NiriResult<std::unique_ptr<NiriTransport>> NiriClient::request(std::string_view line) {
        if (!connector_) {
            return std::unexpected(NiriErrorInfo{std::string(kContext), "no connector"});
        }
        auto transport = connector_();
        if (!transport) {
            return std::unexpected(transport.error());
        }
        if (const auto sent = (*transport)->send_line(line); !sent) {
            return std::unexpected(sent.error());
        }
        const auto reply = (*transport)->read_line();
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (const auto handled = parse_handled_reply(*reply); !handled) {
            return std::unexpected(handled.error());
        }
        return std::move(*transport);
    }

} // namespace niritaskbar

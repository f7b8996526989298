#include "niritaskbar/update_socket.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "niritaskbar/logging.hpp"

namespace niritaskbar {

    namespace {

        constexpr int kListenBacklog = 8;

        using SendFn                 = ssize_t (*)(int, const void*, size_t, int);

        SendFn g_send_fn             = ::send;

        std::string errno_text(std::string_view what) {
            return std::string(what) + ": " + std::strerror(errno);
        }

        std::optional<sockaddr_un> socket_address(const std::filesystem::path& path) {
            sockaddr_un address{};
            address.sun_family = AF_UNIX;
            const auto& native = path.native();
            if (native.size() >= sizeof(address.sun_path)) {
                return std::nullopt;
            }
            std::memcpy(address.sun_path, native.c_str(), native.size() + 1);
            return address;
        }

    } // namespace

#ifdef NIRITASKBAR_TESTING
    void set_update_socket_send_fn_for_tests(UpdateSocketSendFn fn) {
        g_send_fn = fn ? fn : ::send;
    }

    void reset_update_socket_send_fn_for_tests() {
        g_send_fn = ::send;
    }
#endif

    UpdateSocketServer::UpdateSocketServer(std::filesystem::path socket_path, size_t max_backlog) : socket_path_(std::move(socket_path)), max_backlog_(max_backlog) {}

    UpdateSocketServer::~UpdateSocketServer() {
        stop();
    }

    std::optional<std::string> UpdateSocketServer::start() {
        if (running_) {
            return std::nullopt;
        }

        std::error_code ec;
        if (const auto parent = socket_path_.parent_path(); !parent.empty() && !std::filesystem::create_directories(parent, ec) && ec) {
            return "unable to create " + parent.string() + ": " + ec.message();
        }
        // A stale socket from a previous run would make bind fail.
        std::filesystem::remove(socket_path_, ec);

        const auto address = socket_address(socket_path_);
        if (!address) {
            return "update socket path too long: " + socket_path_.string();
        }

        FileDescriptor listener(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
        if (!listener) {
            return errno_text("unable to create update socket");
        }
        if (::bind(listener.get(), reinterpret_cast<const sockaddr*>(&*address), sizeof(*address)) < 0) {
            return errno_text("unable to bind " + socket_path_.string());
        }
        if (::listen(listener.get(), kListenBacklog) < 0) {
            return errno_text("unable to listen on " + socket_path_.string());
        }

        int wake[2] = {-1, -1};
        if (::pipe2(wake, O_CLOEXEC | O_NONBLOCK) < 0) {
            return errno_text("unable to create wakeup pipe");
        }
        wake_read_.reset(wake[0]);
        wake_write_.reset(wake[1]);
        server_fd_ = std::move(listener);

        running_   = true;
        acceptor_  = std::thread([this] { accept_loop(); });
        return std::nullopt;
    }

    void UpdateSocketServer::stop() {
        if (!running_.exchange(false)) {
            return;
        }
        const char byte = 0;
        if (::write(wake_write_.get(), &byte, 1) < 0 && errno != EAGAIN) {
            warn_log("update socket", errno_text("wakeup failed"));
        }
        if (acceptor_.joinable()) {
            acceptor_.join();
        }

        {
            std::lock_guard lock(mutex_);
            clients_.clear();
            last_line_.clear();
        }
        server_fd_.reset();
        wake_read_.reset();
        wake_write_.reset();

        std::error_code ec;
        std::filesystem::remove(socket_path_, ec);
    }

    void UpdateSocketServer::broadcast(std::string_view line) {
        if (!running_) {
            return;
        }

        std::lock_guard lock(mutex_);
        last_line_.assign(line);
        last_line_.push_back('\n');
        std::erase_if(clients_, [this](Client& client) {
            client.backlog += last_line_;
            switch (flush(client)) {
                case FlushResult::kDrained: return false;
                case FlushResult::kFailed: return true;
                case FlushResult::kBlocked: break;
            }
            if (client.backlog.size() > max_backlog_) {
                warn_log("update socket", "dropping client with " + std::to_string(client.backlog.size()) + " unsent bytes");
                return true;
            }
            return false;
        });
    }

    size_t UpdateSocketServer::client_count() const {
        std::lock_guard lock(mutex_);
        return clients_.size();
    }

    void UpdateSocketServer::accept_loop() {
        pollfd watched[] = {
            {.fd = server_fd_.get(), .events = POLLIN, .revents = 0},
            {.fd = wake_read_.get(), .events = POLLIN, .revents = 0},
        };

        while (running_) {
            if (::poll(watched, 2, -1) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                error_log("update socket", errno_text("poll failed"));
                return;
            }
            if (watched[1].revents != 0) {
                return;
            }
            if ((watched[0].revents & POLLIN) != 0) {
                accept_pending();
            }
        }
    }

    void UpdateSocketServer::accept_pending() {
        for (;;) {
            FileDescriptor peer(::accept4(server_fd_.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK));
            if (!peer) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    warn_log("update socket", errno_text("accept failed"));
                }
                return;
            }

            std::lock_guard lock(mutex_);
            Client          client{.fd = std::move(peer), .backlog = last_line_};
            if (flush(client) != FlushResult::kFailed) {
                clients_.push_back(std::move(client));
            }
        }
    }

    UpdateSocketServer::FlushResult UpdateSocketServer::flush(Client& client) {
        std::string_view remaining = client.backlog;
        while (!remaining.empty()) {
            const ssize_t written = g_send_fn(client.fd.get(), remaining.data(), remaining.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
            if (written > 0) {
                remaining.remove_prefix(static_cast<size_t>(written));
                continue;
            }
            const int error = written < 0 ? errno : EPIPE;
            if (error == EINTR) {
                continue;
            }
            client.backlog.erase(0, client.backlog.size() - remaining.size());
            return error == EAGAIN || error == EWOULDBLOCK ? FlushResult::kBlocked : FlushResult::kFailed;
        }
        client.backlog.clear();
        return FlushResult::kDrained;
    }

} // namespace niritaskbar

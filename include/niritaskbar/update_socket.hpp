#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "niritaskbar/file_descriptor.hpp"

namespace niritaskbar {

    // Fans JSON update lines out to every connected bar client.
    //
    // Clients are accepted on a background thread and receive the most recent
    // line as soon as they connect. A client that stops reading is dropped once
    // its unsent bytes exceed max_backlog.
    class UpdateSocketServer {
      public:
        static constexpr size_t kDefaultMaxBacklog = size_t{1} << 20;

        explicit UpdateSocketServer(std::filesystem::path socket_path, size_t max_backlog = kDefaultMaxBacklog);
        ~UpdateSocketServer();

        UpdateSocketServer(const UpdateSocketServer&)            = delete;
        UpdateSocketServer& operator=(const UpdateSocketServer&) = delete;

        std::optional<std::string> start();
        void                       stop();
        // Appends the line terminator.
        void                       broadcast(std::string_view line);
        size_t                     client_count() const;

        bool                       running() const {
            return running_.load();
        }
        const std::filesystem::path& socket_path() const {
            return socket_path_;
        }

      private:
        struct Client {
            FileDescriptor fd;
            // Bytes the peer has not accepted yet.
            std::string    backlog;
        };

        enum class FlushResult {
            kDrained,
            kBlocked,
            kFailed,
        };

        void                  accept_loop();
        void                  accept_pending();
        static FlushResult    flush(Client& client);

        std::filesystem::path socket_path_;
        size_t                max_backlog_;
        FileDescriptor        server_fd_;
        FileDescriptor        wake_read_;
        FileDescriptor        wake_write_;
        mutable std::mutex    mutex_;
        std::vector<Client>   clients_;
        std::string           last_line_;
        std::atomic<bool>     running_ = false;
        std::thread           acceptor_;
    };

#ifdef NIRITASKBAR_TESTING
    using UpdateSocketSendFn = ssize_t (*)(int, const void*, size_t, int);

    void set_update_socket_send_fn_for_tests(UpdateSocketSendFn fn);
    void reset_update_socket_send_fn_for_tests();
#endif

} // namespace niritaskbar

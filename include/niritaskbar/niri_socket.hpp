#ifndef NIRITASKBAR_NIRI_SOCKET_HPP
#define NIRITASKBAR_NIRI_SOCKET_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "niritaskbar/file_descriptor.hpp"
#include "niritaskbar/niri_ipc.hpp"

namespace niritaskbar {

    // A newline-delimited connection to the compositor.
    class NiriTransport {
      public:
        virtual ~NiriTransport()                                  = default;
        virtual NiriResult<void>        send_line(std::string_view line) = 0;
        virtual NiriResult<std::string> read_line()                      = 0;
        // Unblocks a pending read_line from another thread.
        virtual void shutdown() {}
    };

    class NiriSocket : public NiriTransport {
        struct ConnectedTag {};

      public:
        static NiriResult<std::unique_ptr<NiriSocket>> connect(const std::filesystem::path& socket_path);

        // Only connect() can name the tag.
        NiriSocket(ConnectedTag, FileDescriptor fd);

        NiriResult<void>                               send_line(std::string_view line) override;
        NiriResult<std::string>                        read_line() override;
        void                                           shutdown() override;

      private:
        FileDescriptor fd_;
        std::string    buffer_;
    };

    using NiriConnector = std::function<NiriResult<std::unique_ptr<NiriTransport>>()>;

    NiriConnector socket_connector(std::filesystem::path socket_path);

    class NiriClient {
      public:
        explicit NiriClient(NiriConnector connector);

        NiriResult<void>                           activate_window(uint64_t id);
        NiriResult<std::unique_ptr<NiriTransport>> open_event_stream();

      private:
        NiriResult<std::unique_ptr<NiriTransport>> request(std::string_view line);

        NiriConnector                              connector_;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_NIRI_SOCKET_HPP

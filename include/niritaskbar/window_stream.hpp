#ifndef NIRITASKBAR_WINDOW_STREAM_HPP
#define NIRITASKBAR_WINDOW_STREAM_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "niritaskbar/niri_socket.hpp"
#include "niritaskbar/types.hpp"
#include "niritaskbar/window_set.hpp"

namespace niritaskbar {

    // Receives each snapshot; returning false means nobody is listening any more.
    using SnapshotSink = std::function<bool(Snapshot)>;

    // Reads events until the transport fails or the sink stops accepting.
    NiriResult<void> run_window_stream(NiriTransport& transport, WindowSet& window_set, const SnapshotSink& sink, bool debug_logging);

    class WindowStream {
      public:
        // on_finished runs on the worker thread when the stream ends without stop().
        WindowStream(NiriClient& client, SnapshotSink sink, bool debug_logging, std::function<void()> on_finished = {});
        ~WindowStream();

        WindowStream(const WindowStream&)            = delete;
        WindowStream& operator=(const WindowStream&) = delete;

        void          start();
        void          stop();

      private:
        void                           run();
        void                           stream_events();

        NiriClient&                    client_;
        SnapshotSink                   sink_;
        bool                           debug_logging_;
        std::function<void()>          on_finished_;
        std::mutex                     mutex_;
        std::unique_ptr<NiriTransport> transport_;
        bool                           stopping_ = false;
        std::thread                    thread_;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_WINDOW_STREAM_HPP

#include "niritaskbar/window_stream.hpp"

#include <string>
#include <utility>

#include "niritaskbar/logging.hpp"

namespace niritaskbar {

    NiriResult<void> run_window_stream(NiriTransport& transport, WindowSet& window_set, const SnapshotSink& sink, bool debug_logging) {
        while (true) {
            const auto line = transport.read_line();
            if (!line) {
                return std::unexpected(line.error());
            }
            const auto event = parse_event(*line);
            if (!event) {
                error_log("window stream", format_niri_error(event.error()));
                continue;
            }
            debug_log(debug_logging, "window stream", std::string(event_name(*event)));
            auto snapshot = window_set.apply(*event);
            if (!snapshot) {
                continue;
            }
            if (!sink(std::move(*snapshot))) {
                debug_log(debug_logging, "window stream", "snapshot receiver closed");
                return {};
            }
        }
    }

    WindowStream::WindowStream(NiriClient& client, SnapshotSink sink, bool debug_logging, std::function<void()> on_finished) :
        client_(client), sink_(std::move(sink)), debug_logging_(debug_logging), on_finished_(std::move(on_finished)) {}

    WindowStream::~WindowStream() {
        stop();
    }

    void WindowStream::start() {
        if (thread_.joinable()) {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            stopping_ = false;
        }
        thread_ = std::thread([this] { run(); });
    }

    void WindowStream::stop() {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
            if (transport_) {
                transport_->shutdown();
            }
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        transport_.reset();
    }

    void WindowStream::run() {
        stream_events();
        bool stopped = false;
        {
            std::lock_guard lock(mutex_);
            stopped = stopping_;
        }
        if (!stopped && on_finished_) {
            on_finished_();
        }
    }

    void WindowStream::stream_events() {
        auto stream = client_.open_event_stream();
        if (!stream) {
            error_log("window stream", format_niri_error(stream.error()));
            return;
        }
        NiriTransport* transport = nullptr;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }
            transport_ = std::move(*stream);
            transport  = transport_.get();
        }

        WindowSet  window_set(debug_logging_);
        const auto result = run_window_stream(*transport, window_set, sink_, debug_logging_);
        if (!result) {
            std::lock_guard lock(mutex_);
            if (!stopping_) {
                error_log("window stream", format_niri_error(result.error()));
            }
        }
    }

} // namespace niritaskbar

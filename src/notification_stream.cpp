#include "niritaskbar/notification_stream.hpp"

#include <utility>

#include "niritaskbar/logging.hpp"

namespace niritaskbar {

    EnrichedNotification enrich_notification(RawNotification raw, const PidResolver& resolve) {
        EnrichedNotification enriched{.notification = std::move(raw.notification), .resolved_pid = std::nullopt};
        if (resolve && !raw.sender.empty()) {
            if (const auto pid = resolve(raw.sender)) {
                enriched.resolved_pid = static_cast<int64_t>(*pid);
            }
        }
        return enriched;
    }

    NotificationStream::NotificationStream(PidResolver resolve, NotificationSink sink, bool debug_logging) :
        resolve_(std::move(resolve)), sink_(std::move(sink)), debug_logging_(debug_logging), worker_([this] { run(); }) {}

    NotificationStream::~NotificationStream() {
        stop();
    }

    bool NotificationStream::push(RawNotification raw) {
        return incoming_.send(std::move(raw));
    }

    void NotificationStream::stop() {
        incoming_.close();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    void NotificationStream::run() {
        while (auto raw = incoming_.receive()) {
            const auto sender   = raw->sender;
            auto       enriched = enrich_notification(std::move(*raw), resolve_);
            if (debug_logging_) {
                const auto pid = enriched.pid();
                debug_log(true, "notification", "sender=" + sender + " pid=" + (pid ? std::to_string(*pid) : std::string("none")));
            }
            if (!sink_(std::move(enriched))) {
                debug_log(debug_logging_, "notification", "receiver closed; stopping");
                incoming_.close();
                return;
            }
        }
    }

} // namespace niritaskbar

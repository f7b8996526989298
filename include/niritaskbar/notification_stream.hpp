#ifndef NIRITASKBAR_NOTIFICATION_STREAM_HPP
#define NIRITASKBAR_NOTIFICATION_STREAM_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "niritaskbar/channel.hpp"
#include "niritaskbar/notification.hpp"

namespace niritaskbar {

    // A notification as captured off the bus, before its sender is resolved.
    struct RawNotification {
        std::string  sender;
        Notification notification;
    };

    using PidResolver        = std::function<std::optional<uint32_t>(std::string_view peer)>;
    using NotificationSink   = std::function<bool(EnrichedNotification)>;

    EnrichedNotification enrich_notification(RawNotification raw, const PidResolver& resolve);

    // Resolves senders off the bus thread and forwards enriched notifications.
    class NotificationStream {
      public:
        NotificationStream(PidResolver resolve, NotificationSink sink, bool debug_logging);
        ~NotificationStream();

        NotificationStream(const NotificationStream&)            = delete;
        NotificationStream& operator=(const NotificationStream&) = delete;

        // Safe from any thread; false once the stream has stopped.
        bool push(RawNotification raw);
        void stop();

      private:
        void                     run();

        PidResolver              resolve_;
        NotificationSink         sink_;
        bool                     debug_logging_;
        Channel<RawNotification> incoming_;
        std::thread              worker_;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_NOTIFICATION_STREAM_HPP

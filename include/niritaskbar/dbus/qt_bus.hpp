#ifndef NIRITASKBAR_DBUS_QT_BUS_HPP
#define NIRITASKBAR_DBUS_QT_BUS_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <QDBusConnection>
#include <QDBusMessage>
#include <QMetaObject>
#include <QVariant>

#include "niritaskbar/bus.hpp"
#include "niritaskbar/notification.hpp"
#include "niritaskbar/notification_stream.hpp"

namespace niritaskbar::dbus {

    // GetConnectionUnixProcessID against the session bus daemon.
    class QtBusIntrospector final : public BusIntrospector {
      public:
        explicit QtBusIntrospector(QDBusConnection connection = QDBusConnection::sessionBus());

        BusResult<uint32_t> connection_unix_process_id(std::string_view peer) override;

      private:
        QDBusConnection connection_;
    };

    std::optional<HintValue>  hint_value_from_variant(const QVariant& value);
    HintMap                   hint_map_from_variant(const QVariant& value);
    // Decodes the susssasa{sv}i arguments of a Notify call.
    BusResult<NotifyCall>     notify_call_from_message(const QDBusMessage& message);

    using RawNotificationSink = std::function<void(RawNotification)>;

    // Eavesdrops on org.freedesktop.Notifications.Notify through a dedicated
    // monitor connection. Callbacks run on the Qt event loop thread.
    class NotificationMonitor {
      public:
        NotificationMonitor(RawNotificationSink sink, bool debug_logging);
        ~NotificationMonitor();

        NotificationMonitor(const NotificationMonitor&)            = delete;
        NotificationMonitor& operator=(const NotificationMonitor&) = delete;

        BusResult<void> start();
        void            stop();

      private:
        class Receiver;

        RawNotificationSink       sink_;
        bool                      debug_logging_;
        QString                   connection_name_;
        std::unique_ptr<Receiver> receiver_;
        bool                      running_ = false;
    };

    using NameOwnerSink = std::function<void(NameOwnerChange)>;

    // Forwards every NameOwnerChanged signal on the session bus.
    class NameOwnerWatcher {
      public:
        explicit NameOwnerWatcher(NameOwnerSink sink, QDBusConnection connection = QDBusConnection::sessionBus());
        ~NameOwnerWatcher();

        NameOwnerWatcher(const NameOwnerWatcher&)            = delete;
        NameOwnerWatcher& operator=(const NameOwnerWatcher&) = delete;

        BusResult<void> start();
        void            stop();

      private:
        NameOwnerSink           sink_;
        QDBusConnection         connection_;
        QMetaObject::Connection subscription_;
    };

} // namespace niritaskbar::dbus

#endif // NIRITASKBAR_DBUS_QT_BUS_HPP

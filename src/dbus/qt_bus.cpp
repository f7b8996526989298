#include "niritaskbar/dbus/qt_bus.hpp"

#include <limits>
#include <string>
#include <utility>

#include <QDBusArgument>
#include <QDBusConnectionInterface>
#include <QDBusError>
#include <QDBusMetaType>
#include <QDBusVariant>
#include <QDBusVirtualObject>
#include <QMetaType>
#include <QStringList>
#include <QVariantMap>

#include "niritaskbar/failsafe.hpp"
#include "niritaskbar/logging.hpp"

namespace niritaskbar::dbus {

    namespace {

        const QString kBusService    = QStringLiteral("org.freedesktop.DBus");
        const QString kBusPath       = QStringLiteral("/org/freedesktop/DBus");
        const QString kBusInterface  = QStringLiteral("org.freedesktop.DBus");
        const QString kMonitoring    = QStringLiteral("org.freedesktop.DBus.Monitoring");
        const QString kNotifications = QStringLiteral("org.freedesktop.Notifications");
        const QString kNotifyRule    = QStringLiteral("type='method_call',interface='org.freedesktop.Notifications',member='Notify'");

        std::string   to_std(const QString& value) {
            return value.toStdString();
        }

        QVariant unwrap(QVariant value) {
            while (value.typeId() == qMetaTypeId<QDBusVariant>()) {
                value = value.value<QDBusVariant>().variant();
            }
            return value;
        }

        template <typename T>
        std::optional<T> argument_as(const QVariant& value) {
            if (!value.canConvert<T>()) {
                return std::nullopt;
            }
            return value.value<T>();
        }

    } // namespace

    QtBusIntrospector::QtBusIntrospector(QDBusConnection connection) : connection_(std::move(connection)) {}

    BusResult<uint32_t> QtBusIntrospector::connection_unix_process_id(std::string_view peer) {
        auto message = QDBusMessage::createMethodCall(kBusService, kBusPath, kBusInterface, QStringLiteral("GetConnectionUnixProcessID"));
        message << QString::fromUtf8(peer.data(), static_cast<qsizetype>(peer.size()));

        const QDBusMessage reply = connection_.call(message);
        if (reply.type() == QDBusMessage::ErrorMessage) {
            return std::unexpected(BusErrorInfo{.context = "GetConnectionUnixProcessID", .message = to_std(reply.errorName() + QStringLiteral(": ") + reply.errorMessage())});
        }
        const auto arguments = reply.arguments();
        if (arguments.size() != 1 || arguments.front().typeId() != QMetaType::UInt) {
            return std::unexpected(BusErrorInfo{.context = "GetConnectionUnixProcessID", .message = "unexpected reply signature " + to_std(reply.signature())});
        }
        return arguments.front().toUInt();
    }

    std::optional<HintValue> hint_value_from_variant(const QVariant& raw) {
        const QVariant value = unwrap(raw);
        switch (value.typeId()) {
            case QMetaType::Bool: return HintValue(value.toBool());
            case QMetaType::UChar:
            case QMetaType::Short:
            case QMetaType::UShort:
            case QMetaType::Int:
            case QMetaType::UInt:
            case QMetaType::LongLong: return HintValue(static_cast<int64_t>(value.toLongLong()));
            case QMetaType::ULongLong: {
                const auto number = value.toULongLong();
                if (number > static_cast<qulonglong>(std::numeric_limits<int64_t>::max())) {
                    return std::nullopt;
                }
                return HintValue(static_cast<int64_t>(number));
            }
            case QMetaType::Double: return HintValue(value.toDouble());
            case QMetaType::QString: return HintValue(to_std(value.toString()));
            default: return std::nullopt;
        }
    }

    HintMap hint_map_from_variant(const QVariant& value) {
        QVariantMap map;
        if (value.typeId() == qMetaTypeId<QDBusArgument>()) {
            map = qdbus_cast<QVariantMap>(value.value<QDBusArgument>());
        } else if (value.typeId() == QMetaType::QVariantMap) {
            map = value.toMap();
        }

        HintMap hints;
        for (auto it = map.cbegin(); it != map.cend(); ++it) {
            if (auto hint = hint_value_from_variant(it.value())) {
                hints.emplace(to_std(it.key()), std::move(*hint));
            }
        }
        return hints;
    }

    BusResult<NotifyCall> notify_call_from_message(const QDBusMessage& message) {
        const auto arguments = message.arguments();
        if (arguments.size() != 8) {
            return std::unexpected(BusErrorInfo{.context = "Notify", .message = "expected 8 arguments, got " + std::to_string(arguments.size())});
        }

        const auto app_name    = argument_as<QString>(arguments[0]);
        const auto replaces_id = argument_as<uint>(arguments[1]);
        const auto app_icon    = argument_as<QString>(arguments[2]);
        const auto summary     = argument_as<QString>(arguments[3]);
        const auto body        = argument_as<QString>(arguments[4]);
        const auto actions     = argument_as<QStringList>(arguments[5]);
        const auto expire      = argument_as<int>(arguments[7]);
        if (!app_name || !replaces_id || !app_icon || !summary || !body || !actions || !expire) {
            return std::unexpected(BusErrorInfo{.context = "Notify", .message = "unexpected argument signature " + to_std(message.signature())});
        }

        NotifyCall call;
        call.app_name    = to_std(*app_name);
        call.replaces_id = *replaces_id;
        call.app_icon    = to_std(*app_icon);
        call.summary     = to_std(*summary);
        call.body        = to_std(*body);
        for (const auto& action : *actions) {
            call.actions.push_back(to_std(action));
        }
        call.hints          = hint_map_from_variant(arguments[6]);
        call.expire_timeout = *expire;
        return call;
    }

    // Registered on the monitor connection for every object path. Monitored
    // calls must never be answered, so every message is claimed.
    class NotificationMonitor::Receiver final : public QDBusVirtualObject {
      public:
        Receiver(const RawNotificationSink& sink, bool debug_logging) : sink_(sink), debug_logging_(debug_logging) {}

        QString introspect(const QString&) const override {
            return {};
        }

        bool handleMessage(const QDBusMessage& message, const QDBusConnection&) override {
            if (message.type() != QDBusMessage::MethodCallMessage || message.interface() != kNotifications || message.member() != QStringLiteral("Notify")) {
                return true;
            }
            auto call = notify_call_from_message(message);
            if (!call) {
                warn_log("notification monitor", format_bus_error(call.error()));
                return true;
            }
            RawNotification raw{.sender = to_std(message.service()), .notification = decode_notification(std::move(*call))};
            debug_log(debug_logging_, "notification monitor", "notification from " + raw.sender + ": " + raw.notification.summary);
            if (const auto error = failsafe::capture([&] { sink_(std::move(raw)); })) {
                error_log("notification monitor", "sink failed: " + *error);
            }
            return true;
        }

      private:
        const RawNotificationSink& sink_;
        bool                       debug_logging_;
    };

    NotificationMonitor::NotificationMonitor(RawNotificationSink sink, bool debug_logging) :
        sink_(std::move(sink)), debug_logging_(debug_logging), connection_name_(QStringLiteral("niri-taskbar-notification-monitor")) {}

    NotificationMonitor::~NotificationMonitor() {
        stop();
    }

    BusResult<void> NotificationMonitor::start() {
        if (running_) {
            return {};
        }
        auto connection = QDBusConnection::connectToBus(QDBusConnection::SessionBus, connection_name_);
        if (!connection.isConnected()) {
            const auto error = connection.lastError();
            QDBusConnection::disconnectFromBus(connection_name_);
            return std::unexpected(BusErrorInfo{.context = "notification monitor", .message = "unable to connect to session bus: " + to_std(error.message())});
        }

        receiver_ = std::make_unique<Receiver>(sink_, debug_logging_);
        if (!connection.registerVirtualObject(QStringLiteral("/"), receiver_.get(), QDBusConnection::SubPath)) {
            receiver_.reset();
            QDBusConnection::disconnectFromBus(connection_name_);
            return std::unexpected(BusErrorInfo{.context = "notification monitor", .message = "unable to register monitor receiver"});
        }

        auto message = QDBusMessage::createMethodCall(kBusService, kBusPath, kMonitoring, QStringLiteral("BecomeMonitor"));
        message << QStringList{kNotifyRule} << 0u;
        const QDBusMessage reply = connection.call(message);
        if (reply.type() == QDBusMessage::ErrorMessage) {
            connection.unregisterObject(QStringLiteral("/"), QDBusConnection::UnregisterTree);
            receiver_.reset();
            QDBusConnection::disconnectFromBus(connection_name_);
            return std::unexpected(BusErrorInfo{.context = "BecomeMonitor", .message = to_std(reply.errorName() + QStringLiteral(": ") + reply.errorMessage())});
        }

        debug_log(debug_logging_, "notification monitor", "monitoring Notify calls");
        running_ = true;
        return {};
    }

    void NotificationMonitor::stop() {
        if (!running_) {
            return;
        }
        running_ = false;
        QDBusConnection(connection_name_).unregisterObject(QStringLiteral("/"), QDBusConnection::UnregisterTree);
        QDBusConnection::disconnectFromBus(connection_name_);
        receiver_.reset();
    }

    NameOwnerWatcher::NameOwnerWatcher(NameOwnerSink sink, QDBusConnection connection) : sink_(std::move(sink)), connection_(std::move(connection)) {}

    NameOwnerWatcher::~NameOwnerWatcher() {
        stop();
    }

    BusResult<void> NameOwnerWatcher::start() {
        if (subscription_) {
            return {};
        }
        auto* bus = connection_.interface();
        if (bus == nullptr) {
            return std::unexpected(BusErrorInfo{.context = "name owner watcher", .message = "bus connection has no daemon interface"});
        }
        subscription_ = QObject::connect(bus, &QDBusConnectionInterface::serviceOwnerChanged, bus, [this](const QString& name, const QString& old_owner, const QString& new_owner) {
            NameOwnerChange change{.name = to_std(name), .old_owner = to_std(old_owner), .new_owner = to_std(new_owner)};
            if (const auto error = failsafe::capture([&] { sink_(std::move(change)); })) {
                error_log("name owner watcher", "sink failed: " + *error);
            }
        });
        if (!subscription_) {
            return std::unexpected(BusErrorInfo{.context = "name owner watcher", .message = "unable to subscribe to NameOwnerChanged"});
        }
        return {};
    }

    void NameOwnerWatcher::stop() {
        if (subscription_) {
            QObject::disconnect(subscription_);
            subscription_ = {};
        }
    }

} // namespace niritaskbar::dbus

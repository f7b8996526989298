#ifndef NIRITASKBAR_BUS_HPP
#define NIRITASKBAR_BUS_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace niritaskbar {

    struct BusErrorInfo {
        std::string context;
        std::string message;
    };

    inline std::string format_bus_error(const BusErrorInfo& error) {
        if (error.context.empty()) {
            return error.message;
        }
        return error.context + ": " + error.message;
    }

    template <typename T>
    using BusResult = std::expected<T, BusErrorInfo>;

    // Resolves a bus peer to the process behind it.
    class BusIntrospector {
      public:
        virtual ~BusIntrospector()                                                     = default;
        virtual BusResult<uint32_t> connection_unix_process_id(std::string_view peer) = 0;
    };

    // org.freedesktop.DBus.NameOwnerChanged; an empty owner means none.
    struct NameOwnerChange {
        std::string name;
        std::string old_owner;
        std::string new_owner;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_BUS_HPP

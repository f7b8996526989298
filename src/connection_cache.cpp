#include "niritaskbar/connection_cache.hpp"

#include <utility>

#include "niritaskbar/logging.hpp"

namespace niritaskbar {

    CacheTable::CacheTable(std::chrono::milliseconds ttl) : ttl_(ttl) {}

    const CacheEntry* CacheTable::lookup(std::string_view peer, CacheClock::time_point now) {
        const auto it = entries_.find(std::string(peer));
        if (it == entries_.end()) {
            return nullptr;
        }
        it->second.expiry = now + ttl_;
        return &it->second;
    }

    void CacheTable::insert(std::string peer, std::optional<uint32_t> pid, CacheClock::time_point now) {
        entries_.insert_or_assign(std::move(peer), CacheEntry{.pid = pid, .expiry = now + ttl_});
    }

    void CacheTable::remove(std::string_view peer) {
        entries_.erase(std::string(peer));
    }

    size_t CacheTable::expire(CacheClock::time_point now) {
        return std::erase_if(entries_, [now](const auto& item) { return item.second.expiry <= now; });
    }

    size_t CacheTable::size() const {
        return entries_.size();
    }

    ConnectionCache::ConnectionCache(BusIntrospector& introspector, ConnectionCacheOptions options) :
        introspector_(introspector), options_(std::move(options)), table_(options_.ttl), worker_([this] { run(); }) {}

    ConnectionCache::~ConnectionCache() {
        messages_.close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    std::optional<uint32_t> ConnectionCache::get(std::string_view peer) {
        std::promise<std::optional<uint32_t>> promise;
        auto                                  future = promise.get_future();
        if (!messages_.send(GetRequest{.peer = std::string(peer), .result = std::move(promise)})) {
            error_log("connection cache", "worker is no longer running");
            return std::nullopt;
        }
        try {
            return future.get();
        } catch (const std::future_error& ex) {
            error_log("connection cache", ex.what());
            return std::nullopt;
        }
    }

    void ConnectionCache::name_owner_changed(NameOwnerChange change) {
        if (!messages_.send(std::move(change))) {
            debug_log(options_.debug_logging, "connection cache", "dropping owner change after shutdown");
        }
    }

#ifdef NIRITASKBAR_TESTING
    void ConnectionCache::sweep_for_tests() {
        std::promise<size_t> promise;
        auto                 future = promise.get_future();
        if (messages_.send(SweepRequest{.expire = true, .remaining = std::move(promise)})) {
            future.wait();
        }
    }

    size_t ConnectionCache::size_for_tests() {
        std::promise<size_t> promise;
        auto                 future = promise.get_future();
        if (!messages_.send(SweepRequest{.expire = false, .remaining = std::move(promise)})) {
            return 0;
        }
        return future.get();
    }
#endif

    void ConnectionCache::run() {
        auto next_sweep = CacheClock::now() + options_.sweep_interval;
        while (true) {
            auto message = messages_.receive_until(next_sweep);
            if (!message && messages_.closed()) {
                break;
            }
            if (CacheClock::now() >= next_sweep) {
                const auto removed = table_.expire(now());
                debug_log(options_.debug_logging, "connection cache", "expired " + std::to_string(removed) + " entries");
                next_sweep = CacheClock::now() + options_.sweep_interval;
            }
            if (!message) {
                continue;
            }
            if (auto* request = std::get_if<GetRequest>(&*message)) {
                handle(*request);
            } else if (const auto* change = std::get_if<NameOwnerChange>(&*message)) {
                handle(*change);
            } else if (auto* sweep = std::get_if<SweepRequest>(&*message)) {
                if (sweep->expire) {
                    table_.expire(now());
                }
                sweep->remaining.set_value(table_.size());
            }
        }
    }

    void ConnectionCache::handle(GetRequest& request) {
        if (const auto* entry = table_.lookup(request.peer, now())) {
            request.result.set_value(entry->pid);
            return;
        }
        const auto pid = resolve(request.peer);
        table_.insert(request.peer, pid, now());
        request.result.set_value(pid);
    }

    void ConnectionCache::handle(const NameOwnerChange& change) {
        if (!change.new_owner.empty()) {
            if (const auto pid = resolve(change.new_owner)) {
                table_.insert(change.new_owner, pid, now());
            }
            return;
        }
        if (!change.old_owner.empty()) {
            table_.remove(change.old_owner);
        }
    }

    std::optional<uint32_t> ConnectionCache::resolve(std::string_view peer) {
        const auto pid = introspector_.connection_unix_process_id(peer);
        if (!pid) {
            debug_log(options_.debug_logging, "connection cache", format_bus_error(pid.error()));
            return std::nullopt;
        }
        return *pid;
    }

    CacheClock::time_point ConnectionCache::now() const {
        if (options_.clock) {
            return options_.clock();
        }
        return CacheClock::now();
    }

} // namespace niritaskbar

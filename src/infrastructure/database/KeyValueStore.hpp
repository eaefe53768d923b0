#pragma once

#include "core/services/IKeyValueStore.hpp"
#include "infrastructure/database/Database.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace fleetwatch::infra {

/**
 * @brief IKeyValueStore backed by the kv_entries table.
 *
 * Expiry is lazy: reads ignore rows whose expires_at has passed, and
 * purgeExpired() deletes them. Every SQLite failure surfaces as
 * core::StateStoreError.
 */
class KeyValueStore : public core::IKeyValueStore {
public:
    /// Returns the current time in unix seconds.
    using Clock = std::function<int64_t()>;

    /**
     * @param database Connection with migrations applied.
     * @param clock Time source; the system clock when empty.
     */
    explicit KeyValueStore(std::shared_ptr<Database> database, Clock clock = {});

    std::optional<std::string> get(const std::string& key) override;
    void setEx(const std::string& key, const std::string& value,
               std::chrono::seconds ttl) override;
    bool setIfAbsent(const std::string& key, const std::string& value,
                     std::chrono::seconds ttl) override;
    void remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    std::map<std::string, std::string> hashGetAll(const std::string& key) override;
    void hashSet(const std::string& key,
                 const std::map<std::string, std::string>& fields) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;

    /**
     * @brief Remaining lifetime of a key; std::nullopt if absent or without expiry.
     */
    std::optional<std::chrono::seconds> ttl(const std::string& key);

    /**
     * @brief Deletes expired rows.
     * @return Number of rows removed.
     */
    int purgeExpired();

private:
    struct Entry {
        std::string kind;
        std::string value;
        std::optional<int64_t> expiresAt;
    };

    std::optional<Entry> loadLive(const std::string& key);
    int64_t now() const;

    std::shared_ptr<Database> db_;
    Clock clock_;
    std::mutex mutex_;
};

} // namespace fleetwatch::infra

#include "infrastructure/database/KeyValueStore.hpp"

#include "core/types/Errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

namespace {

constexpr const char* LIVE_CONDITION = "(expires_at IS NULL OR expires_at > ?)";

template <typename Func>
auto guarded(const char* operation, const std::string& key, Func&& func) -> decltype(func()) {
    try {
        return func();
    } catch (const core::StateStoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::StateStoreError(std::string(operation) + " '" + key + "' failed: " + e.what());
    }
}

} // namespace

KeyValueStore::KeyValueStore(std::shared_ptr<Database> database, Clock clock)
    : db_(std::move(database)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() {
            return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                            std::chrono::system_clock::now().time_since_epoch())
                                            .count());
        };
    }
}

int64_t KeyValueStore::now() const {
    return clock_();
}

std::optional<KeyValueStore::Entry> KeyValueStore::loadLive(const std::string& key) {
    auto stmt = db_->prepare(std::string("SELECT kind, value, expires_at FROM kv_entries "
                                         "WHERE key = ? AND ") +
                             LIVE_CONDITION);
    stmt.bind(1, key);
    stmt.bind(2, now());
    if (!stmt.step()) {
        return std::nullopt;
    }
    Entry entry;
    entry.kind = stmt.columnText(0);
    entry.value = stmt.columnText(1);
    if (!stmt.columnIsNull(2)) {
        entry.expiresAt = stmt.columnInt64(2);
    }
    return entry;
}

std::optional<std::string> KeyValueStore::get(const std::string& key) {
    return guarded("GET", key, [&]() -> std::optional<std::string> {
        std::lock_guard lock(mutex_);
        auto entry = loadLive(key);
        if (!entry) {
            return std::nullopt;
        }
        if (entry->kind != "string") {
            throw core::StateStoreError("Key '" + key + "' holds a hash, not a string");
        }
        return entry->value;
    });
}

void KeyValueStore::setEx(const std::string& key, const std::string& value,
                          std::chrono::seconds ttl) {
    guarded("SETEX", key, [&]() {
        std::lock_guard lock(mutex_);
        auto stmt = db_->prepare(R"(
            INSERT INTO kv_entries (key, kind, value, expires_at) VALUES (?, 'string', ?, ?)
            ON CONFLICT(key) DO UPDATE SET
                kind = 'string', value = excluded.value, expires_at = excluded.expires_at
        )");
        stmt.bind(1, key);
        stmt.bind(2, value);
        stmt.bind(3, now() + ttl.count());
        stmt.step();
    });
}

bool KeyValueStore::setIfAbsent(const std::string& key, const std::string& value,
                                std::chrono::seconds ttl) {
    return guarded("SET NX", key, [&]() {
        std::lock_guard lock(mutex_);
        const int64_t current = now();
        auto stmt = db_->prepare(R"(
            INSERT INTO kv_entries (key, kind, value, expires_at) VALUES (?, 'string', ?, ?)
            ON CONFLICT(key) DO UPDATE SET
                kind = 'string', value = excluded.value, expires_at = excluded.expires_at
            WHERE kv_entries.expires_at IS NOT NULL AND kv_entries.expires_at <= ?
        )");
        stmt.bind(1, key);
        stmt.bind(2, value);
        stmt.bind(3, current + ttl.count());
        stmt.bind(4, current);
        stmt.step();
        return db_->changes() > 0;
    });
}

void KeyValueStore::remove(const std::string& key) {
    guarded("DEL", key, [&]() {
        std::lock_guard lock(mutex_);
        auto stmt = db_->prepare("DELETE FROM kv_entries WHERE key = ?");
        stmt.bind(1, key);
        stmt.step();
    });
}

bool KeyValueStore::exists(const std::string& key) {
    return guarded("EXISTS", key, [&]() {
        std::lock_guard lock(mutex_);
        return loadLive(key).has_value();
    });
}

std::map<std::string, std::string> KeyValueStore::hashGetAll(const std::string& key) {
    return guarded("HGETALL", key, [&]() {
        std::lock_guard lock(mutex_);
        std::map<std::string, std::string> fields;
        auto entry = loadLive(key);
        if (!entry) {
            return fields;
        }
        if (entry->kind != "hash") {
            throw core::StateStoreError("Key '" + key + "' holds a string, not a hash");
        }
        auto object = nlohmann::json::parse(entry->value);
        for (auto it = object.begin(); it != object.end(); ++it) {
            fields[it.key()] = it->get<std::string>();
        }
        return fields;
    });
}

void KeyValueStore::hashSet(const std::string& key,
                            const std::map<std::string, std::string>& fields) {
    guarded("HSET", key, [&]() {
        std::lock_guard lock(mutex_);
        db_->transaction([&]() {
            nlohmann::json object = nlohmann::json::object();
            std::optional<int64_t> expiresAt;

            if (auto entry = loadLive(key)) {
                if (entry->kind != "hash") {
                    throw core::StateStoreError("Key '" + key + "' holds a string, not a hash");
                }
                object = nlohmann::json::parse(entry->value);
                expiresAt = entry->expiresAt;
            }
            for (const auto& [field, value] : fields) {
                object[field] = value;
            }

            auto stmt = db_->prepare(R"(
                INSERT INTO kv_entries (key, kind, value, expires_at) VALUES (?, 'hash', ?, ?)
                ON CONFLICT(key) DO UPDATE SET
                    kind = 'hash', value = excluded.value, expires_at = excluded.expires_at
            )");
            stmt.bind(1, key);
            stmt.bind(2, object.dump());
            if (expiresAt) {
                stmt.bind(3, *expiresAt);
            } else {
                stmt.bindNull(3);
            }
            stmt.step();
        });
    });
}

bool KeyValueStore::expire(const std::string& key, std::chrono::seconds ttl) {
    return guarded("EXPIRE", key, [&]() {
        std::lock_guard lock(mutex_);
        const int64_t current = now();
        auto stmt = db_->prepare(std::string("UPDATE kv_entries SET expires_at = ? "
                                             "WHERE key = ? AND ") +
                                 LIVE_CONDITION);
        stmt.bind(1, current + ttl.count());
        stmt.bind(2, key);
        stmt.bind(3, current);
        stmt.step();
        return db_->changes() > 0;
    });
}

std::optional<std::chrono::seconds> KeyValueStore::ttl(const std::string& key) {
    return guarded("TTL", key, [&]() -> std::optional<std::chrono::seconds> {
        std::lock_guard lock(mutex_);
        auto entry = loadLive(key);
        if (!entry || !entry->expiresAt) {
            return std::nullopt;
        }
        return std::chrono::seconds(*entry->expiresAt - now());
    });
}

int KeyValueStore::purgeExpired() {
    return guarded("PURGE", "*", [&]() {
        std::lock_guard lock(mutex_);
        auto stmt = db_->prepare(
            "DELETE FROM kv_entries WHERE expires_at IS NOT NULL AND expires_at <= ?");
        stmt.bind(1, now());
        stmt.step();
        int removed = db_->changes();
        if (removed > 0) {
            spdlog::debug("Purged {} expired state entries", removed);
        }
        return removed;
    });
}

} // namespace fleetwatch::infra

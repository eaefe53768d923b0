/**
 * @file IKeyValueStore.hpp
 * @brief Interface for the TTL key-value store shared by discovery and polling.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace fleetwatch::core {

/**
 * @brief String and hash values with per-key expiry.
 *
 * Every call touches exactly one key. Expired keys behave as absent.
 * All methods throw StateStoreError when the backing store fails.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Stores a string value that expires after @p ttl.
     */
    virtual void setEx(const std::string& key, const std::string& value,
                       std::chrono::seconds ttl) = 0;

    /**
     * @brief Atomically stores the value only if the key is absent.
     * @return True if the value was stored.
     */
    virtual bool setIfAbsent(const std::string& key, const std::string& value,
                             std::chrono::seconds ttl) = 0;

    virtual void remove(const std::string& key) = 0;

    virtual bool exists(const std::string& key) = 0;

    /**
     * @brief All fields of a hash; empty when the key is absent.
     */
    virtual std::map<std::string, std::string> hashGetAll(const std::string& key) = 0;

    /**
     * @brief Merges fields into a hash, creating it without expiry when absent.
     */
    virtual void hashSet(const std::string& key,
                         const std::map<std::string, std::string>& fields) = 0;

    /**
     * @brief Sets the expiry of an existing key.
     * @return False if the key does not exist.
     */
    virtual bool expire(const std::string& key, std::chrono::seconds ttl) = 0;
};

} // namespace fleetwatch::core

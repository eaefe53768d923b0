#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/KeyValueStore.hpp"

#include <filesystem>

using namespace fleetwatch::infra;
using namespace fleetwatch::core;
using namespace std::chrono_literals;

namespace {

class TestStore {
public:
    TestStore() : dbPath_(std::filesystem::temp_directory_path() / "fleetwatch_kv_test.db") {
        std::filesystem::remove(dbPath_);
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
        store_ = std::make_shared<KeyValueStore>(db_, [this] { return now; });
    }

    ~TestStore() {
        store_.reset();
        db_.reset();
        std::filesystem::remove(dbPath_);
    }

    KeyValueStore& operator*() { return *store_; }
    KeyValueStore* operator->() { return store_.get(); }

    int64_t now{1000};

private:
    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
    std::shared_ptr<KeyValueStore> store_;
};

} // namespace

TEST_CASE("Key-value strings with expiry", "[KeyValueStore]") {
    TestStore store;

    SECTION("Set and get") {
        store->setEx("a", "one", 10s);
        REQUIRE(store->get("a") == "one");
        REQUIRE(store->exists("a"));
        REQUIRE(store->ttl("a") == 10s);
    }

    SECTION("Expired keys behave as absent") {
        store->setEx("a", "one", 10s);
        store.now += 10;
        REQUIRE_FALSE(store->get("a").has_value());
        REQUIRE_FALSE(store->exists("a"));
    }

    SECTION("Overwrite replaces value and expiry") {
        store->setEx("a", "one", 10s);
        store->setEx("a", "two", 50s);
        REQUIRE(store->get("a") == "two");
        REQUIRE(store->ttl("a") == 50s);
    }

    SECTION("Remove") {
        store->setEx("a", "one", 10s);
        store->remove("a");
        REQUIRE_FALSE(store->exists("a"));
        REQUIRE_NOTHROW(store->remove("never-there"));
    }
}

TEST_CASE("Key-value set-if-absent", "[KeyValueStore]") {
    TestStore store;

    REQUIRE(store->setIfAbsent("lock", "1", 30s));
    REQUIRE_FALSE(store->setIfAbsent("lock", "2", 30s));
    REQUIRE(store->get("lock") == "1");

    SECTION("An expired holder can be replaced") {
        store.now += 30;
        REQUIRE(store->setIfAbsent("lock", "2", 30s));
        REQUIRE(store->get("lock") == "2");
    }

    SECTION("A removed holder can be replaced") {
        store->remove("lock");
        REQUIRE(store->setIfAbsent("lock", "3", 30s));
    }
}

TEST_CASE("Key-value hashes", "[KeyValueStore]") {
    TestStore store;

    SECTION("Fields merge and missing hash is empty") {
        REQUIRE(store->hashGetAll("h").empty());
        store->hashSet("h", {{"a", "1"}, {"b", "2"}});
        store->hashSet("h", {{"b", "3"}, {"c", "4"}});
        auto fields = store->hashGetAll("h");
        REQUIRE(fields == std::map<std::string, std::string>{{"a", "1"}, {"b", "3"}, {"c", "4"}});
    }

    SECTION("New hashes have no expiry until expire is called") {
        store->hashSet("h", {{"a", "1"}});
        REQUIRE_FALSE(store->ttl("h").has_value());
        REQUIRE(store->expire("h", 60s));
        REQUIRE(store->ttl("h") == 60s);
    }

    SECTION("hashSet keeps an existing expiry") {
        store->hashSet("h", {{"a", "1"}});
        store->expire("h", 60s);
        store.now += 20;
        store->hashSet("h", {{"a", "2"}});
        REQUIRE(store->ttl("h") == 40s);
    }

    SECTION("An expired hash starts over") {
        store->hashSet("h", {{"a", "1"}});
        store->expire("h", 5s);
        store.now += 5;
        store->hashSet("h", {{"b", "2"}});
        REQUIRE(store->hashGetAll("h") == std::map<std::string, std::string>{{"b", "2"}});
    }

    SECTION("Expire on a missing key reports false") {
        REQUIRE_FALSE(store->expire("missing", 5s));
    }

    SECTION("Type mismatch is a store error") {
        store->setEx("s", "text", 10s);
        REQUIRE_THROWS_AS(store->hashGetAll("s"), StateStoreError);
        REQUIRE_THROWS_AS(store->hashSet("s", {{"a", "1"}}), StateStoreError);
    }
}

TEST_CASE("Key-value purge", "[KeyValueStore]") {
    TestStore store;
    store->setEx("short", "x", 5s);
    store->setEx("long", "x", 500s);
    store->hashSet("forever", {{"a", "1"}});

    store.now += 10;
    REQUIRE(store->purgeExpired() == 1);
    REQUIRE(store->exists("long"));
    REQUIRE(store->exists("forever"));
    REQUIRE(store->purgeExpired() == 0);
}

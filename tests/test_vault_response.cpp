#include <catch2/catch_test_macros.hpp>
#include "store/vault_response.hpp"

using namespace vaultagent;
using namespace std::chrono_literals;

TEST_CASE("Vault response: HTTP status classification", "[vault]") {
    CHECK(vault::classify_status(200, false) == StoreErrorCode::NONE);
    CHECK(vault::classify_status(204, false) == StoreErrorCode::NONE);
    CHECK(vault::classify_status(401, false) == StoreErrorCode::UNAUTHORIZED);
    CHECK(vault::classify_status(403, false) == StoreErrorCode::UNAUTHORIZED);
    CHECK(vault::classify_status(404, false) == StoreErrorCode::NOT_FOUND);
    CHECK(vault::classify_status(500, false) == StoreErrorCode::UNAVAILABLE);
    CHECK(vault::classify_status(503, true) == StoreErrorCode::UNAVAILABLE);

    SECTION("400 means unknown role only on credential endpoints") {
        CHECK(vault::classify_status(400, true) == StoreErrorCode::NOT_FOUND);
        CHECK(vault::classify_status(400, false) == StoreErrorCode::UNAVAILABLE);
    }
}

TEST_CASE("Vault response: error detail", "[vault]") {
    CHECK(vault::error_detail(R"({"errors":["permission denied"]})") == "permission denied");
    CHECK(vault::error_detail(R"({"errors":[]})").empty());
    CHECK(vault::error_detail("<html>bad gateway</html>").empty());
}

TEST_CASE("Vault response: AppRole login", "[vault][auth]") {
    SECTION("valid") {
        auto r = vault::parse_login(
            R"({"auth":{"client_token":"hvs.abc","lease_duration":2764800,"renewable":true}})");
        REQUIRE(r.is_ok());
        CHECK(r.value().token == "hvs.abc");
        CHECK(r.value().lease_duration == 2764800s);
        CHECK(r.value().renewable);
    }

    SECTION("missing lease means non-expiring") {
        auto r = vault::parse_login(R"({"auth":{"client_token":"root"}})");
        REQUIRE(r.is_ok());
        CHECK(r.value().lease_duration == 0s);
    }

    SECTION("no token") {
        auto r = vault::parse_login(R"({"auth":null})");
        REQUIRE(r.is_error());
        CHECK(r.error_code() == StoreErrorCode::UNAVAILABLE);
    }

    SECTION("not JSON") {
        CHECK(vault::parse_login("not json").error_code() == StoreErrorCode::UNAVAILABLE);
    }
}

TEST_CASE("Vault response: KV reads", "[vault][kv]") {
    SECTION("v2 with metadata and non-string values") {
        auto r = vault::parse_kv_read(R"({
            "data": {
                "data": {"user": "admin", "port": 5432, "tags": ["a","b"]},
                "metadata": {"version": 3, "created_time": "2024-01-01T00:00:00Z"}
            }
        })", 2);
        REQUIRE(r.is_ok());
        const auto& data = r.value().data;
        CHECK(data.at("user") == "admin");
        CHECK(data.at("port") == "5432");
        CHECK(data.at("tags") == R"(["a","b"])");
        REQUIRE(r.value().version.has_value());
        CHECK(*r.value().version == 3);
    }

    SECTION("v2 deleted version is not found") {
        auto r = vault::parse_kv_read(R"({"data":{"data":null,"metadata":{"version":2}}})", 2);
        REQUIRE(r.is_error());
        CHECK(r.error_code() == StoreErrorCode::NOT_FOUND);
    }

    SECTION("v1 with lease") {
        auto r = vault::parse_kv_read(R"({"data":{"password":"s3cret"},"lease_duration":768})", 1);
        REQUIRE(r.is_ok());
        CHECK(r.value().data.at("password") == "s3cret");
        REQUIRE(r.value().lease_duration.has_value());
        CHECK(*r.value().lease_duration == 768s);
        CHECK_FALSE(r.value().version.has_value());
    }
}

TEST_CASE("Vault response: list keys", "[vault][kv]") {
    auto r = vault::parse_list(R"({"data":{"keys":["config","nested/"]}})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    CHECK(r.value()[1] == "nested/");

    auto empty = vault::parse_list(R"({"data":null})");
    REQUIRE(empty.is_ok());
    CHECK(empty.value().empty());
}

TEST_CASE("Vault response: database credentials", "[vault][credentials]") {
    SECTION("dynamic") {
        auto r = vault::parse_credential(R"({
            "lease_id": "database/creds/app/abc123",
            "lease_duration": 3600,
            "renewable": true,
            "data": {"username": "v-app-xyz", "password": "A1a-pw"}
        })");
        REQUIRE(r.is_ok());
        CHECK(r.value().lease_id == "database/creds/app/abc123");
        CHECK(r.value().username == "v-app-xyz");
        CHECK(r.value().password == "A1a-pw");
        CHECK(r.value().lease_duration == 3600s);
    }

    SECTION("dynamic without password is malformed") {
        auto r = vault::parse_credential(R"({"data":{"username":"u"}})");
        CHECK(r.error_code() == StoreErrorCode::UNAVAILABLE);
    }

    SECTION("static") {
        auto r = vault::parse_static_credential(R"({
            "data": {
                "username": "report",
                "password": "pw",
                "last_vault_rotation": "2024-05-01T10:00:00Z",
                "rotation_period": 86400,
                "ttl": 3000
            }
        })");
        REQUIRE(r.is_ok());
        CHECK(r.value().username == "report");
        REQUIRE(r.value().rotation_period.has_value());
        CHECK(*r.value().rotation_period == 86400s);
        REQUIRE(r.value().last_vault_rotation.has_value());
        CHECK(*r.value().last_vault_rotation == "2024-05-01T10:00:00Z");
    }
}

TEST_CASE("Vault response: KV mount version", "[vault][kv]") {
    CHECK(vault::parse_mount_kv_version(R"({"type":"kv","options":{"version":"2"}})") == 2);
    CHECK(vault::parse_mount_kv_version(R"({"data":{"options":{"version":"1"}}})") == 1);
    CHECK_FALSE(vault::parse_mount_kv_version(R"({"type":"kv","options":null})").has_value());
    CHECK_FALSE(vault::parse_mount_kv_version("").has_value());
}

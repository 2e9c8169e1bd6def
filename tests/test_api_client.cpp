#include <catch2/catch.hpp>
#include "api_client.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace prisma;

static const char* kBase = "http://localhost:8081";

static void logged_in(ApiClient& api, MockHttpClient& http) {
    http.response_queue.push_back({200, R"({"id":1,"username":"alice","role":"member","token":"tok123"})"});
    api.login("alice", "pw");
}

// ── login ────────────────────────────────────────────────────────

TEST_CASE("ApiClient: login stores user and token", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    http.next_response = {200, R"({"id":4,"username":"alice","role":"admin","avatar_url":"a.png","token":"tok"})"};

    api.login("alice", "secret");

    REQUIRE(http.last_method == "POST");
    REQUIRE(http.last_url == "http://localhost:8081/api/login");
    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["username"] == "alice");
    REQUIRE(body["password"] == "secret");
    REQUIRE(http.header("Content-Type") == "application/json");

    REQUIRE(api.logged_in());
    REQUIRE(api.token() == "tok");
    REQUIRE(api.user().id == 4);
    REQUIRE(api.user().username == "alice");
    REQUIRE(api.user().role == "admin");
}

TEST_CASE("ApiClient: trailing slash in base URL is ignored", "[api_client]") {
    MockHttpClient http;
    ApiClient api("http://localhost:8081/", http);
    logged_in(api, http);
    REQUIRE(http.last_url == "http://localhost:8081/api/login");
}

TEST_CASE("ApiClient: rejected credentials throw AuthError", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    http.next_response = {401, "invalid credentials"};
    REQUIRE_THROWS_AS(api.login("alice", "wrong"), AuthError);
    REQUIRE_FALSE(api.logged_in());
}

TEST_CASE("ApiClient: unreachable server throws AuthError", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    http.next_response = {0, "", "connect to localhost:8081 failed"};
    try {
        api.login("alice", "pw");
        FAIL("expected AuthError");
    } catch (const AuthError& e) {
        REQUIRE(std::string(e.what()) ==
                "login failed with status: request did not complete "
                "(connect to localhost:8081 failed)");
    }
}

TEST_CASE("ApiClient: login without token is a failure", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    http.next_response = {200, R"({"id":4,"username":"alice"})"};
    REQUIRE_THROWS_AS(api.login("alice", "pw"), AuthError);
    REQUIRE_FALSE(api.logged_in());
}

TEST_CASE("ApiClient: undecodable login response is a failure", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    http.next_response = {200, "<html>"};
    REQUIRE_THROWS_AS(api.login("alice", "pw"), AuthError);
}

// ── categories ───────────────────────────────────────────────────

TEST_CASE("ApiClient: get_categories sends bearer token", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    logged_in(api, http);
    http.next_response = {200, R"([{"id":1,"name":"Text","position":0,"channels":[{"id":10,"name":"general","category_id":1,"position":0}]}])"};

    auto cats = api.get_categories();

    REQUIRE(http.last_method == "GET");
    REQUIRE(http.last_url == "http://localhost:8081/api/categories");
    REQUIRE(http.header("Authorization") == "Bearer tok123");
    REQUIRE(http.header("Content-Type").empty());
    REQUIRE(cats.size() == 1);
    REQUIRE(cats[0].channels[0].name == "general");
}

TEST_CASE("ApiClient: get_categories failures throw LoadError", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    logged_in(api, http);

    http.next_response = {500, "oops"};
    REQUIRE_THROWS_AS(api.get_categories(), LoadError);
    http.next_response = {200, "not json"};
    REQUIRE_THROWS_AS(api.get_categories(), LoadError);
    http.next_response = {200, R"({"id":1})"};
    REQUIRE_THROWS_AS(api.get_categories(), LoadError);
}

// ── messages ─────────────────────────────────────────────────────

TEST_CASE("ApiClient: get_messages keeps server order", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    logged_in(api, http);
    http.next_response = {200, R"([{"id":3,"channel_id":7},{"id":2,"channel_id":7},{"id":1,"channel_id":7}])"};

    auto msgs = api.get_messages(7);

    REQUIRE(http.last_url == "http://localhost:8081/api/channels/7/messages");
    REQUIRE(msgs.size() == 3);
    REQUIRE(msgs[0].id == 3);
    REQUIRE(msgs[2].id == 1);
}

TEST_CASE("ApiClient: get_messages failure throws LoadError", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    logged_in(api, http);
    http.next_response = {404, ""};
    REQUIRE_THROWS_AS(api.get_messages(7), LoadError);
}

// ── send ─────────────────────────────────────────────────────────

TEST_CASE("ApiClient: send_message posts channel and content", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    logged_in(api, http);
    http.next_response = {201, R"({"id":99})"};

    api.send_message(7, "hello");

    REQUIRE(http.last_method == "POST");
    REQUIRE(http.last_url == "http://localhost:8081/api/messages");
    REQUIRE(http.header("Authorization") == "Bearer tok123");
    REQUIRE(http.header("Content-Type") == "application/json");
    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["channel_id"] == 7);
    REQUIRE(body["content"] == "hello");
    REQUIRE_FALSE(body.contains("user_id"));
}

TEST_CASE("ApiClient: send_message requires 201", "[api_client]") {
    MockHttpClient http;
    ApiClient api(kBase, http);
    logged_in(api, http);
    http.next_response = {200, "ok"};
    REQUIRE_THROWS_AS(api.send_message(7, "hello"), SendError);

    http.next_response = {403, "not a member"};
    try {
        api.send_message(7, "hello");
        FAIL("expected SendError");
    } catch (const SendError& e) {
        REQUIRE(std::string(e.what()).find("not a member") != std::string::npos);
    }
}

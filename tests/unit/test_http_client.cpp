#include <gtest/gtest.h>
#include "postrelay/network/http_client.hpp"
#include "support/scripted_transport.hpp"

using namespace postrelay::network;
using postrelay::test_support::ScriptedTransport;
using postrelay::test_support::respond;

class HttpClientTest : public ::testing::Test {
protected:
    ScriptedTransport transport;
    HttpClient client{transport};
};

TEST_F(HttpClientTest, GetJsonDecodesBody) {
    transport.on("GET", "/tweets", respond(200, R"({"tweets":[]})"));

    auto body = client.get_json("/tweets");
    EXPECT_TRUE(body["tweets"].isArray());

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].headers.get("accept"), std::optional<std::string>("application/json"));
}

TEST_F(HttpClientTest, PostJsonSetsContentTypeAndEnforcesStatus) {
    transport.on("POST", "/level1/tweets", respond(500, "boom"));

    try {
        client.post_json("/level1/tweets", Json::Value("x"));
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.body(), "boom");
    }

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].headers.get("Content-Type"), std::optional<std::string>("application/json"));
}

TEST_F(HttpClientTest, PostJsonAcceptsEmptyBody) {
    transport.on("POST", "/level4/tweets", respond(204));
    auto body = client.post_json("/level4/tweets", Json::Value(Json::objectValue));
    EXPECT_TRUE(body.isNull());
}

TEST_F(HttpClientTest, PostJsonRawReturnsAnyStatus) {
    transport.on("POST", "/level2/tweets", respond(429, "slow down", {{"Retry-After", "3"}}));

    auto response = client.post_json_raw("/level2/tweets", Json::Value(Json::objectValue),
                                         {{"Idempotency-Key", "k-1"}});
    EXPECT_EQ(response.status, 429);
    EXPECT_EQ(response.headers.get("retry-after"), std::optional<std::string>("3"));
    EXPECT_EQ(transport.requests()[0].headers.get("idempotency-key"), std::optional<std::string>("k-1"));
}

TEST_F(HttpClientTest, PutBytesDefaultsToOctetStream) {
    transport.on("PUT", "/level3/uploads/s/chunk", respond(204));

    auto response = client.put_bytes("/level3/uploads/s/chunk", "abc");
    EXPECT_EQ(response.status, 204);

    auto request = transport.requests()[0];
    EXPECT_EQ(request.body, "abc");
    EXPECT_EQ(request.headers.get("content-type"), std::optional<std::string>("application/octet-stream"));
}

class ServerEndpointTest : public ::testing::Test {};

TEST_F(ServerEndpointTest, ParsesHostPortAndPrefix) {
    auto endpoint = ServerEndpoint::parse("http://localhost:8080/api/");
    EXPECT_EQ(endpoint.host, "localhost");
    EXPECT_EQ(endpoint.port, "8080");
    EXPECT_EQ(endpoint.base_path, "/api");
    EXPECT_EQ(endpoint.target_for("/tweets"), "/api/tweets");
    EXPECT_EQ(endpoint.target_for("tweets"), "/api/tweets");
}

TEST_F(ServerEndpointTest, DefaultsToPort80) {
    auto endpoint = ServerEndpoint::parse("http://example.test");
    EXPECT_EQ(endpoint.port, "80");
    EXPECT_EQ(endpoint.target_for("/tweets"), "/tweets");
}

TEST_F(ServerEndpointTest, RejectsUnsupportedUrls) {
    EXPECT_THROW(ServerEndpoint::parse("https://example.test"), std::invalid_argument);
    EXPECT_THROW(ServerEndpoint::parse("http://"), std::invalid_argument);
    EXPECT_THROW(ServerEndpoint::parse("http://host:/x"), std::invalid_argument);
}

TEST_F(ServerEndpointTest, UnreachableServerIsTransportError) {
    BeastHttpTransport transport("http://127.0.0.1:1", std::chrono::milliseconds(2000));
    HttpRequest request;
    request.path = "/tweets";

    try {
        transport.perform(request);
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(e.kind(), TransportErrorKind::INVALID_RESPONSE);
    }
}

/**
 * @file test_network_transport_client.cpp
 * @brief Unit tests for network_transport_client and form encoding
 */

#include <gtest/gtest.h>

#include <kcenon/media_upload/transport/network_transport_client.h>

#include <chrono>
#include <map>
#include <string>

namespace kcenon::media_upload::test {

class FormEncodingTest : public ::testing::Test {};

TEST_F(FormEncodingTest, UrlEncodeKeepsUnreserved) {
    EXPECT_EQ(url_encode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST_F(FormEncodingTest, UrlEncodeEscapesReserved) {
    EXPECT_EQ(url_encode("a b&c=d/e+f"), "a%20b%26c%3Dd%2Fe%2Bf");
    EXPECT_EQ(url_encode("\xC3\xA9"), "%C3%A9");
}

TEST_F(FormEncodingTest, EncodeFormKeepsFieldOrder) {
    form_fields fields{{"command", "APPEND"}, {"media_id", "42"}, {"media_data", "ab+/="}};

    EXPECT_EQ(encode_form(fields), "command=APPEND&media_id=42&media_data=ab%2B%2F%3D");
}

TEST_F(FormEncodingTest, EncodeEmptyForm) {
    EXPECT_EQ(encode_form({}), "");
}

class TransportResponseTest : public ::testing::Test {};

TEST_F(TransportResponseTest, StatusClasses) {
    transport_response response;
    response.status_code = 204;
    EXPECT_TRUE(response.is_success());

    response.status_code = 404;
    EXPECT_TRUE(response.is_client_error());
    EXPECT_FALSE(response.is_success());

    response.status_code = 503;
    EXPECT_TRUE(response.is_server_error());
}

TEST_F(TransportResponseTest, HeaderLookupIgnoresCase) {
    transport_response response;
    response.headers["Content-Type"] = "application/json";

    EXPECT_EQ(response.get_header("content-type").value_or(""), "application/json");
    EXPECT_FALSE(response.get_header("x-rate-limit-remaining").has_value());
}

class NetworkTransportClientTest : public ::testing::Test {};

TEST_F(NetworkTransportClientTest, AuthenticatedWithCookie) {
    network_transport_client client(
        std::map<std::string, std::string>{{"Cookie", "auth_token=abc; ct0=def"}});
    EXPECT_TRUE(client.is_authenticated());
}

TEST_F(NetworkTransportClientTest, AuthenticatedWithAuthorization) {
    network_transport_client client(
        std::map<std::string, std::string>{{"authorization", "Bearer token"}});
    EXPECT_TRUE(client.is_authenticated());
}

TEST_F(NetworkTransportClientTest, NotAuthenticatedWithoutCredentials) {
    network_transport_client client(
        std::map<std::string, std::string>{{"User-Agent", "media-upload"}});
    EXPECT_FALSE(client.is_authenticated());

    network_transport_client empty_cookie(std::map<std::string, std::string>{{"Cookie", ""}});
    EXPECT_FALSE(empty_cookie.is_authenticated());
}

TEST_F(NetworkTransportClientTest, RequestTimeoutOverridesDefault) {
    network_transport_client client(std::map<std::string, std::string>{},
                                    std::chrono::milliseconds(30000));

    request_options options;
    options.timeout = std::chrono::milliseconds(1500);
    EXPECT_EQ(client.effective_timeout(options), std::chrono::milliseconds(1500));

    options.timeout = std::chrono::milliseconds(0);
    EXPECT_EQ(client.effective_timeout(options), std::chrono::milliseconds(30000));
}

TEST_F(NetworkTransportClientTest, ReducedTimeoutDoesNotBlockCancellation) {
    network_transport_client client;
    cancellation_token token;
    token.cancel();

    request_options options;
    options.timeout = std::chrono::milliseconds(250);
    options.cancellation = token;

    auto response = client.get_json("https://upload.example.test", {{"command", "STATUS"}},
                                     options);

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::cancelled);
}

TEST_F(NetworkTransportClientTest, CancelledRequestIsNotSent) {
    network_transport_client client;
    cancellation_token token;
    token.cancel();

    request_options options;
    options.cancellation = token;

    auto response = client.post_form("https://upload.example.test", {{"command", "INIT"}},
                                      options);

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::cancelled);
}

TEST_F(NetworkTransportClientTest, UnavailableClientReportsTransportError) {
    network_transport_client client;
    if (client.is_available()) {
        GTEST_SKIP() << "network_system HTTP client is available";
    }

    auto response = client.get_json("https://upload.example.test", {{"command", "STATUS"}}, {});

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::transient_transport);
}

}  // namespace kcenon::media_upload::test

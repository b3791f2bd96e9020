#include <gtest/gtest.h>
#include <regex>
#include "core/service/MemobirdApi.hpp"
#include "core/types/Error.hpp"
#include "core/utils/StringUtils.hpp"
#include "support/FakeHttpTransport.hpp"

using namespace core::types;
using core::service::MemobirdApi;
using test::FakeHttpTransport;
using test::ScriptedResponse;

class MemobirdApiTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHttpTransport> transport = std::make_shared<FakeHttpTransport>();
    core::config::ServiceConfig config;

    void SetUp() override {
        config.apiBaseUrl = "http://memobird.test/home";
    }

    MemobirdApi makeApi() const {
        return MemobirdApi(transport, config, "test-ak");
    }
};

TEST_F(MemobirdApiTest, BindUserSendsSignedQuery) {
    transport->on("/setuserbind", ScriptedResponse::json(
            R"({"showapi_res_code":1,"showapi_res_error":"ok","showapi_userid":"u-123"})"));

    EXPECT_EQ(makeApi().bindUser("device-1", "someone"), "u-123");

    auto requests = transport->requestsTo("/setuserbind");
    ASSERT_EQ(requests.size(), 1u);
    const auto &request = requests[0];
    EXPECT_EQ(request.method, core::http::HttpMethod::Get);
    EXPECT_EQ(request.url, "http://memobird.test/home/setuserbind");
    EXPECT_EQ(FakeHttpTransport::queryValue(request, "ak"), "test-ak");
    EXPECT_EQ(FakeHttpTransport::queryValue(request, "memobirdID"), "device-1");
    EXPECT_EQ(FakeHttpTransport::queryValue(request, "useridentifying"), "someone");
    EXPECT_TRUE(std::regex_match(FakeHttpTransport::queryValue(request, "timestamp"),
                                 std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));
    EXPECT_EQ(request.timeout, std::chrono::seconds(15));
}

TEST_F(MemobirdApiTest, BindUserWithoutUserIdFails) {
    transport->on("/setuserbind", ScriptedResponse::json(R"({"showapi_res_code":1})"));
    EXPECT_THROW(makeApi().bindUser("device-1", ""), PrinterServiceException);
}

TEST_F(MemobirdApiTest, PrintPaperPostsJsonBody) {
    transport->on("/printpaper", ScriptedResponse::json(R"({"showapi_res_code":1,"printcontentid":"42"})"));

    EXPECT_EQ(makeApi().printPaper("device-1", "u-123", "T:SGVsbG8="), 42);

    auto requests = transport->requestsTo("/printpaper");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, core::http::HttpMethod::Post);
    EXPECT_EQ(requests[0].headers.at("Content-Type"), "application/json");
    EXPECT_EQ(requests[0].timeout, std::chrono::seconds(20));

    auto body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(body["ak"], "test-ak");
    EXPECT_EQ(body["printcontent"], "T:SGVsbG8=");
    EXPECT_EQ(body["memobirdID"], "device-1");
    EXPECT_EQ(body["userID"], "u-123");
    EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(MemobirdApiTest, PrintUrlUsesWebPageEndpoint) {
    transport->on("/printpaperFromUrl", ScriptedResponse::json(R"({"showapi_res_code":1,"printcontentid":7})"));

    EXPECT_EQ(makeApi().printUrl("device-1", "u-123", "https://example.com"), 7);

    auto requests = transport->requestsTo("/printpaperFromUrl");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(requests[0].body)["printUrl"], "https://example.com");
    EXPECT_EQ(requests[0].timeout, std::chrono::seconds(30));
}

TEST_F(MemobirdApiTest, ServiceErrorCarriesCodeAndMessage) {
    transport->on("/printpaper", ScriptedResponse::json(R"({"showapi_res_code":0,"showapi_res_error":"device offline"})"));
    try {
        makeApi().printPaper("device-1", "u-123", "T:SGVsbG8=");
        FAIL() << "expected PrinterServiceException";
    } catch (const TokenRejectedException &) {
        FAIL() << "not an authorization failure";
    } catch (const PrinterServiceException &e) {
        EXPECT_EQ(e.code(), 0);
        EXPECT_EQ(e.serviceMessage(), "device offline");
    }
}

TEST_F(MemobirdApiTest, NonJsonBodyIsMalformedResponse) {
    ScriptedResponse html;
    html.body = "<html>gateway</html>";
    transport->on("/printpaper", html);
    try {
        makeApi().printPaper("device-1", "u-123", "T:SGVsbG8=");
        FAIL() << "expected PrinterServiceException";
    } catch (const PrinterServiceException &e) {
        EXPECT_EQ(e.code(), MemobirdApi::RESULT_CODE_MALFORMED);
    }
}

TEST_F(MemobirdApiTest, MissingContentIdFails) {
    transport->on("/printpaper", ScriptedResponse::json(R"({"showapi_res_code":1})"));
    EXPECT_THROW(makeApi().printPaper("device-1", "u-123", "T:SGVsbG8="), PrinterServiceException);
}

TEST_F(MemobirdApiTest, ContentIdOutsideIntRangeIsRejected) {
    for (const char *reply: {R"({"showapi_res_code":1,"printcontentid":5000000000})",
                             R"({"showapi_res_code":1,"printcontentid":"5000000000"})",
                             R"({"showapi_res_code":1,"printcontentid":18446744073709551615})",
                             R"({"showapi_res_code":1,"printcontentid":1e20})"}) {
        auto transportForReply = std::make_shared<FakeHttpTransport>();
        transportForReply->on("/printpaper", ScriptedResponse::json(reply));
        MemobirdApi api(transportForReply, config, "test-ak");
        try {
            api.printPaper("device-1", "u-123", "T:SGVsbG8=");
            FAIL() << "accepted " << reply;
        } catch (const PrinterServiceException &e) {
            EXPECT_EQ(e.code(), MemobirdApi::RESULT_CODE_MALFORMED) << reply;
        }
    }
}

TEST_F(MemobirdApiTest, PrintFlagOutsideIntRangeIsUnknown) {
    transport->on("/getprintstatus", ScriptedResponse::json(R"({"showapi_res_code":1,"printflag":5000000000})"));
    EXPECT_FALSE(makeApi().getPrintFlag(42).has_value());
}

TEST_F(MemobirdApiTest, NonJsonBodyIsCutOnCharacterBoundary) {
    std::string body;
    for (int i = 0; i < 60; ++i) {
        body += "\xE6\x9C\x8D";
    }
    ScriptedResponse page;
    page.body = body;
    transport->on("/printpaper", page);

    try {
        makeApi().printPaper("device-1", "u-123", "T:SGVsbG8=");
        FAIL() << "expected PrinterServiceException";
    } catch (const PrinterServiceException &e) {
        std::string message = e.what();
        EXPECT_EQ(message, core::utils::toValidUtf8(message));
        EXPECT_NE(message.find("\xE6\x9C\x8D..."), std::string::npos);
    }
}

TEST_F(MemobirdApiTest, UnauthorizedStatusIsTokenRejection) {
    ScriptedResponse unauthorized;
    unauthorized.status = 401;
    transport->on("/printpaper", unauthorized);
    EXPECT_THROW(makeApi().printPaper("device-1", "u-123", "T:SGVsbG8="), TokenRejectedException);
}

TEST_F(MemobirdApiTest, ConfiguredEnvelopeCodeIsTokenRejection) {
    config.authFailureCodes = {-3};
    transport->on("/printpaper", ScriptedResponse::json(R"({"showapi_res_code":-3,"showapi_res_error":"bad user"})"));
    EXPECT_THROW(makeApi().printPaper("device-1", "u-123", "T:SGVsbG8="), TokenRejectedException);
}

TEST_F(MemobirdApiTest, OtherHttpErrorsPropagate) {
    ScriptedResponse unavailable;
    unavailable.status = 503;
    transport->on("/printpaper", unavailable);
    EXPECT_THROW(makeApi().printPaper("device-1", "u-123", "T:SGVsbG8="), HttpStatusException);
}

TEST_F(MemobirdApiTest, PrintFlagIsReadFromStatusEndpoint) {
    transport->on("/getprintstatus", ScriptedResponse::json(R"({"showapi_res_code":1,"printflag":"1","extra":true})"));
    EXPECT_EQ(makeApi().getPrintFlag(42), 1);

    auto requests = transport->requestsTo("/getprintstatus");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(FakeHttpTransport::queryValue(requests[0], "printcontentid"), "42");
}

TEST_F(MemobirdApiTest, MissingPrintFlagIsEmpty) {
    transport->on("/getprintstatus", ScriptedResponse::json(R"({"showapi_res_code":1})"));
    EXPECT_FALSE(makeApi().getPrintFlag(42).has_value());
}

TEST_F(MemobirdApiTest, RequiresApiKey) {
    EXPECT_THROW(MemobirdApi(transport, config, ""), std::invalid_argument);
}

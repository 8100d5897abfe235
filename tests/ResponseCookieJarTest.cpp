#include <gtest/gtest.h>

#include "adapters/secondary/ResponseCookieJar.hpp"

using namespace webauth;
using adapters::secondary::ResponseCookieJar;

class ResponseCookieJarTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::WebAuthSettings>();
        settings_->setAppName("MYAPP");
        settings_->setSecureCookies(false);
    }

    // Браузер отправляет обратно "NAME=VALUE" из Set-Cookie
    std::unique_ptr<ResponseCookieJar> nextRequest(const ResponseCookieJar& jar) {
        auto header = jar.setCookieHeader().value_or("");
        return std::make_unique<ResponseCookieJar>(
            ResponseCookieJar::parseCookieHeader(header.substr(0, header.find(';'))), settings_);
    }

    std::shared_ptr<settings::WebAuthSettings> settings_;
};

TEST_F(ResponseCookieJarTest, ParseCookieHeader) {
    auto cookies = ResponseCookieJar::parseCookieHeader("a=1; b = two ;c=; broken; a=3");

    EXPECT_EQ(cookies.size(), 3u);
    EXPECT_EQ(cookies["a"], "1");
    EXPECT_EQ(cookies["b"], "two");
    EXPECT_EQ(cookies["c"], "");
}

TEST_F(ResponseCookieJarTest, AppSpecificNames) {
    ResponseCookieJar jar({}, settings_);

    EXPECT_EQ(jar.appSpecificCookieName("PL"), "MYAPP_PL");
    EXPECT_EQ(jar.csrfCookieName(), "MYAPP_CSRF");
    EXPECT_EQ(jar.stateCookieName(), "MYAPP_STATE");
}

TEST_F(ResponseCookieJarTest, NoChanges_NoHeader) {
    ResponseCookieJar jar({{"MYAPP_STATE", "MYAPP_SID=abc"}}, settings_);
    EXPECT_FALSE(jar.setCookieHeader().has_value());
}

TEST_F(ResponseCookieJarTest, GetCookie_ReadsIncomingOnly) {
    ResponseCookieJar jar({{"MYAPP_STATE", "MYAPP_SID=abc"}, {"OTHER", "1"}}, settings_);
    jar.setCookie("MYAPP_PL", "x.y", std::nullopt);

    EXPECT_EQ(jar.getCookie("MYAPP_SID").value_or(""), "abc");
    EXPECT_EQ(jar.getCookie("OTHER").value_or(""), "1");
    EXPECT_FALSE(jar.getCookie("MYAPP_PL").has_value());
    EXPECT_FALSE(jar.getCookie("MYAPP_STATE").has_value());
}

TEST_F(ResponseCookieJarTest, SessionCookieAttributes) {
    ResponseCookieJar jar({}, settings_);
    jar.setCookie("MYAPP_CSRF", "value", std::nullopt);

    EXPECT_EQ(jar.setCookieHeader().value_or(""),
              "MYAPP_STATE=MYAPP_CSRF=value; Path=/; HttpOnly; SameSite=Strict");
}

TEST_F(ResponseCookieJarTest, SeveralCookies_OneHeader_AllReachNextRequest) {
    ResponseCookieJar jar({}, settings_);
    jar.setCookie("MYAPP_SID", "sid", std::nullopt);
    jar.setCookie("MYAPP_INTEGRITY", "proof", std::nullopt);
    jar.setCookie("MYAPP_PL", "key.token", std::chrono::system_clock::now() + std::chrono::hours(24));
    jar.deleteCookie("MYAPP_CSRF");

    auto next = nextRequest(jar);
    EXPECT_EQ(next->getCookie("MYAPP_SID").value_or(""), "sid");
    EXPECT_EQ(next->getCookie("MYAPP_INTEGRITY").value_or(""), "proof");
    EXPECT_EQ(next->getCookie("MYAPP_PL").value_or(""), "key.token");
    EXPECT_FALSE(next->getCookie("MYAPP_CSRF").has_value());
}

TEST_F(ResponseCookieJarTest, Changes_MergedWithIncoming) {
    ResponseCookieJar first({}, settings_);
    first.setCookie("MYAPP_SID", "sid", std::nullopt);
    first.setCookie("MYAPP_CSRF", "csrf", std::nullopt);

    auto second = nextRequest(first);
    second->setCookie("MYAPP_INTEGRITY", "proof", std::nullopt);
    second->deleteCookie("MYAPP_CSRF");

    auto third = nextRequest(*second);
    EXPECT_EQ(third->getCookie("MYAPP_SID").value_or(""), "sid");
    EXPECT_EQ(third->getCookie("MYAPP_INTEGRITY").value_or(""), "proof");
    EXPECT_FALSE(third->getCookie("MYAPP_CSRF").has_value());
}

TEST_F(ResponseCookieJarTest, PersistentEntry_SetsExpiry) {
    settings_->setSecureCookies(true);
    ResponseCookieJar jar({}, settings_);
    jar.setCookie("MYAPP_SID", "sid", std::nullopt);
    jar.setCookie("MYAPP_PL", "k.t", std::chrono::system_clock::now() + std::chrono::hours(24));

    auto header = jar.setCookieHeader().value_or("");
    EXPECT_NE(header.find("; Expires="), std::string::npos);
    EXPECT_NE(header.find(" GMT; Max-Age="), std::string::npos);
    EXPECT_NE(header.find("; Secure"), std::string::npos);
}

TEST_F(ResponseCookieJarTest, ExpiredEntry_Dropped) {
    auto past = utils::toEpochSeconds(std::chrono::system_clock::now() - std::chrono::hours(1));
    ResponseCookieJar jar(
        {{"MYAPP_STATE", "MYAPP_PL=k.t@" + std::to_string(past) + "&MYAPP_SID=abc"}}, settings_);

    EXPECT_FALSE(jar.getCookie("MYAPP_PL").has_value());
    EXPECT_EQ(jar.getCookie("MYAPP_SID").value_or(""), "abc");
}

TEST_F(ResponseCookieJarTest, ValuesAreEscaped) {
    ResponseCookieJar jar({}, settings_);
    jar.setCookie("MYAPP_X", "a=b&c@d; e", std::nullopt);

    auto header = jar.setCookieHeader().value_or("");
    EXPECT_EQ(header.rfind("MYAPP_STATE=MYAPP_X=a%3Db%26c%40d%3B%20e;", 0), 0u);
    EXPECT_EQ(nextRequest(jar)->getCookie("MYAPP_X").value_or(""), "a=b&c@d; e");
}

TEST_F(ResponseCookieJarTest, MalformedState_FailsClosed) {
    ResponseCookieJar jar({{"MYAPP_STATE", "broken&=x&MYAPP_A=%zz&MYAPP_B=1@soon&MYAPP_C=ok"}}, settings_);

    EXPECT_FALSE(jar.getCookie("MYAPP_A").has_value());
    EXPECT_FALSE(jar.getCookie("MYAPP_B").has_value());
    EXPECT_EQ(jar.getCookie("MYAPP_C").value_or(""), "ok");
}

TEST_F(ResponseCookieJarTest, LastEntryDeleted_DeletesStateCookie) {
    ResponseCookieJar jar({{"MYAPP_STATE", "MYAPP_SID=abc"}}, settings_);
    jar.setCookie("MYAPP_SID", "new", std::nullopt);
    jar.deleteCookie("MYAPP_SID");

    auto header = jar.setCookieHeader().value_or("");
    EXPECT_EQ(header.rfind("MYAPP_STATE=; Expires=Thu, 01 Jan 1970 00:00:00 GMT; Max-Age=0", 0), 0u);
}

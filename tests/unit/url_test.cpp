#include <gtest/gtest.h>

#include <string>

#include "src/http/error/http_error.hpp"
#include "src/http/url/url.hpp"

using tether::http::http_error::ErrorKind;
using tether::http::http_error::HttpError;
namespace url = tether::http::url;

TEST(UrlComposeTest, JoinsBaseAndPath) { EXPECT_EQ(url::compose("https://api.example.com", "/users/1"), "https://api.example.com/users/1"); }

TEST(UrlComposeTest, AbsolutePathIgnoresBase) {
    EXPECT_EQ(url::compose("https://api.example.com", "https://cdn.example.com/logo.png"), "https://cdn.example.com/logo.png");
    EXPECT_EQ(url::compose("", "http://cdn.example.com/a"), "http://cdn.example.com/a");
}

TEST(UrlComposeTest, MalformedPathThrowsInsteadOfCrashing) {
    try {
        (void)url::compose("https://api.example.com", "/has space");
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind_, ErrorKind::INVALID_URL);
    }
}

TEST(UrlComposeTest, MissingBaseIsInvalid) { EXPECT_THROW((void)url::compose("", "/users"), HttpError); }

TEST(UrlComposeTest, ControlCharactersAreInvalid) { EXPECT_THROW((void)url::compose("https://api.example.com", "/a\nb"), HttpError); }

TEST(UrlValidityTest, RequiresSchemeAndHost) {
    EXPECT_TRUE(url::is_valid("https://example.com"));
    EXPECT_TRUE(url::is_valid("http://localhost:8080/x?y=1"));
    EXPECT_FALSE(url::is_valid("example.com/path"));
    EXPECT_FALSE(url::is_valid("ftp://example.com"));
    EXPECT_FALSE(url::is_valid(""));
}

TEST(PercentEncodeTest, KeepsUnreservedCharacters) { EXPECT_EQ(url::percent_encode("AZaz09-._~"), "AZaz09-._~"); }

TEST(PercentEncodeTest, EncodesEverythingElse) {
    EXPECT_EQ(url::percent_encode("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(url::percent_encode("[]"), "%5B%5D");
}

TEST(AppendQueryTest, ChoosesSeparator) {
    EXPECT_EQ(url::append_query("https://x.io/a", "k=v"), "https://x.io/a?k=v");
    EXPECT_EQ(url::append_query("https://x.io/a?p=1", "k=v"), "https://x.io/a?p=1&k=v");
    EXPECT_EQ(url::append_query("https://x.io/a", ""), "https://x.io/a");
}

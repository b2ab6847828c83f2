#include <gtest/gtest.h>
#include "Errors.hpp"
#include "FakeTransport.hpp"
#include "SessionManager.hpp"

using namespace std::chrono_literals;

class SessionManagerTest : public ::testing::Test {
 protected:
  ManualClock clock_{FromEpochMillis(1767225600000)};  // 2026-01-01T00:00Z
  CookieJar jar_;
  FakeTransport transport_;

  SessionManager MakeSession() {
    return SessionManager(Credentials{"ash", "pik@chu"}, SessionOptions{},
                          jar_, transport_, clock_);
  }
};

TEST_F(SessionManagerTest, PostsCredentialsAndKeepsCookies) {
  SCOPED_TRACE("A successful login posts the form and keeps the cookie.");
  RecordProperty("description",
                 "Checks the login URL, the url-encoded LoginID/NewPass body "
                 "and that the session cookie lands in the jar.");

  transport_.SetHandler([](const HttpRequest&) { return LoggedIn("s1"); });
  SessionManager session = MakeSession();
  session.Login();

  EXPECT_TRUE(session.IsValid());
  EXPECT_EQ(session.GetAuthenticatedAt(), clock_.Now());
  EXPECT_EQ(session.GetLoginExchanges(), 1u);
  EXPECT_EQ(jar_.Get("PHPSESSID").value_or(""), "s1");

  auto requests = transport_.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "POST");
  EXPECT_EQ(requests[0].url, "https://www.tppcrpg.net/login.php");
  EXPECT_EQ(requests[0].body, "LoginID=ash&NewPass=pik%40chu");
  EXPECT_EQ(HeaderOf(requests[0], "Content-Type"),
            "application/x-www-form-urlencoded");
}

TEST_F(SessionManagerTest, SkipsLoginInsideWindow) {
  SCOPED_TRACE("A recent login is reused for ten minutes.");
  RecordProperty("description",
                 "Two logins five minutes apart send one exchange; one more "
                 "after the window has passed sends a second.");

  transport_.SetHandler([](const HttpRequest&) { return LoggedIn(); });
  SessionManager session = MakeSession();

  session.Login();
  clock_.Advance(5min);
  session.Login();
  EXPECT_EQ(session.GetLoginExchanges(), 1u);

  clock_.Advance(6min);
  session.Login();
  EXPECT_EQ(session.GetLoginExchanges(), 2u);
}

TEST_F(SessionManagerTest, ForcedLoginAlwaysExchanges) {
  SCOPED_TRACE("force=true ignores the re-validation window.");
  RecordProperty("description",
                 "A forced login right after a successful one still talks to "
                 "the host.");

  transport_.SetHandler([](const HttpRequest&) { return LoggedIn(); });
  SessionManager session = MakeSession();
  session.Login();
  session.Login(true);
  EXPECT_EQ(session.GetLoginExchanges(), 2u);
}

TEST_F(SessionManagerTest, RedirectWithEmptyBodyCounts) {
  SCOPED_TRACE("A 302 after posting the login form is a success.");
  RecordProperty("description",
                 "Status 302 with no body is accepted because the marker "
                 "check only applies to non-empty bodies.");

  transport_.SetHandler([](const HttpRequest&) {
    return WithCookie(Redirect("/index.php"), "PHPSESSID=r; path=/");
  });
  SessionManager session = MakeSession();
  EXPECT_NO_THROW(session.Login());
  EXPECT_TRUE(session.IsValid());
}

TEST_F(SessionManagerTest, ServerErrorIsTransportError) {
  SCOPED_TRACE("HTTP 500 from the login endpoint fails the login.");
  RecordProperty("description",
                 "The error message names the status and the session is left "
                 "invalid.");

  transport_.SetHandler(
    [](const HttpRequest&) { return HttpResponse(500, "oops"); });
  SessionManager session = MakeSession();
  try {
    session.Login();
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_STREQ(e.what(), "login failed (HTTP 500)");
  }
  EXPECT_FALSE(session.IsValid());
}

TEST_F(SessionManagerTest, MissingMarkerIsInvalidCredentials) {
  SCOPED_TRACE("A login page without the logout marker rejected us.");
  RecordProperty("description",
                 "Body 'Welcome' raises InvalidCredentialsError; cookies set "
                 "by that response are still merged.");

  transport_.SetHandler([](const HttpRequest&) {
    return WithCookie(Page("Welcome"), "diag=1");
  });
  SessionManager session = MakeSession();
  EXPECT_THROW(session.Login(), InvalidCredentialsError);
  EXPECT_FALSE(session.IsValid());
  EXPECT_EQ(jar_.Get("diag").value_or(""), "1");
}

TEST_F(SessionManagerTest, FailedLoginInvalidatesPreviousSession) {
  SCOPED_TRACE("A failed forced login drops the old logged-in state.");
  RecordProperty("description",
                 "After a good login, a transport failure during a forced "
                 "login leaves the session invalid.");

  transport_.SetHandler([](const HttpRequest&) { return LoggedIn(); });
  SessionManager session = MakeSession();
  session.Login();
  ASSERT_TRUE(session.IsValid());

  transport_.SetHandler([](const HttpRequest&) -> HttpResponse {
    throw TransportError("connection reset");
  });
  EXPECT_THROW(session.Login(true), TransportError);
  EXPECT_FALSE(session.IsValid());
}

TEST_F(SessionManagerTest, RecognizesLoginLocations) {
  SCOPED_TRACE("Redirect targets naming login.php are login redirects.");
  RecordProperty("description",
                 "Relative, absolute and differently-cased login locations "
                 "match; other pages do not.");

  SessionManager session = MakeSession();
  EXPECT_TRUE(session.IsLoginLocation("/login.php"));
  EXPECT_TRUE(session.IsLoginLocation("login.php?next=/pokemon.php"));
  EXPECT_TRUE(
    session.IsLoginLocation("https://www.tppcrpg.net/Login.php?expired=1"));
  EXPECT_FALSE(session.IsLoginLocation("/pokemon.php"));
  EXPECT_FALSE(session.IsLoginLocation("/"));
}

TEST_F(SessionManagerTest, RejectsEmptyCredentials) {
  SCOPED_TRACE("A session cannot be built without credentials.");
  RecordProperty("description",
                 "An empty password raises ConfigError at construction.");

  EXPECT_THROW(SessionManager(Credentials{"ash", ""}, SessionOptions{}, jar_,
                              transport_, clock_),
               ConfigError);
}

// Tests for the public directory HTTP endpoint.
#include "directoryHttp.hpp"
#include "recordingParticipant.hpp"
#include "registry.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <memory>
#include <string>

namespace {

class DirectoryHttpTest : public ::testing::Test {
protected:
  StagePtr addStage(const std::string& name, bool isPublic) {
    MemberInfo host;
    host.id = "host-" + name;
    host.displayName = name + " host";
    auto stage = std::make_shared<Stage>(io, name, host, makeRecorder());
    if (isPublic) {
      stage->togglePublic();
    }
    registry.add(stage);
    return stage;
  }

  http::response<http::string_body> request(http::verb method, const std::string& target) {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "localhost");
    return handleDirectoryRequest(req, registry);
  }

  boost::asio::io_context io;
  SessionRegistry registry;
};

}  // namespace

TEST_F(DirectoryHttpTest, ListsOnlyPublicStages) {
  addStage("Open", true);
  addStage("Closed", false);

  auto response = request(http::verb::get, "/sessions/public");

  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(response[http::field::content_type], "application/json");
  EXPECT_EQ(response[http::field::access_control_allow_origin], "*");
  json body = json::parse(response.body());
  ASSERT_TRUE(body.is_array());
  ASSERT_EQ(body.size(), 1u);
  EXPECT_EQ(body[0].at("name"), "Open");
  EXPECT_EQ(body[0].at("hostName"), "Open host");
  EXPECT_EQ(body[0].at("audienceCount"), 0);
}

TEST_F(DirectoryHttpTest, EmptyDirectoryIsAnEmptyArray) {
  auto response = request(http::verb::get, "/sessions/public");
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(response.body(), "[]");
}

TEST_F(DirectoryHttpTest, IgnoresQueryString) {
  addStage("Open", true);
  auto response = request(http::verb::get, "/sessions/public?ts=123");
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(json::parse(response.body()).size(), 1u);
}

TEST_F(DirectoryHttpTest, UnknownPathIsNotFound) {
  auto response = request(http::verb::get, "/sessions");
  EXPECT_EQ(response.result(), http::status::not_found);
}

TEST_F(DirectoryHttpTest, OtherMethodsAreNotAllowed) {
  auto response = request(http::verb::post, "/sessions/public");
  EXPECT_EQ(response.result(), http::status::method_not_allowed);
  EXPECT_EQ(response[http::field::allow], "GET");
}

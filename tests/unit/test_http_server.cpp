#include <catch2/catch_test_macros.hpp>

#include "server/http/http_server.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Temporary profiles directory, removed on scope exit.
struct ProfileDir {
  ProfileDir() {
    path = fs::temp_directory_path() / "sentinel_http_profiles";
    fs::remove_all(path);
    fs::create_directories(path);
    for (const char* file : {"finance.yaml", "strict.yml", "notes.txt",
                             ".hidden.yaml"}) {
      std::ofstream(path / file) << "profile_name: x\n";
    }
    fs::create_directories(path / "nested.yaml");
  }
  ~ProfileDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  std::string str() const { return path.string(); }

  fs::path path;
};

}  // namespace

TEST_CASE("ParseRequestHead reads the request line and headers", "[http]") {
  sentinel::HttpRequestHead head;
  REQUIRE(sentinel::ParseRequestHead(
      "POST /v1/chat/completions?trace=1 HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "Content-Type: application/json\r\n"
      "Content-Length:  42 \r\n",
      &head));
  REQUIRE(head.method == "POST");
  REQUIRE(head.path == "/v1/chat/completions");
  REQUIRE(head.headers.at("content-type") == "application/json");
  REQUIRE(head.headers.at("content-length") == "42");
  REQUIRE(head.headers.count("Host") == 0);
}

TEST_CASE("ParseRequestHead rejects a bad request line", "[http]") {
  sentinel::HttpRequestHead head;
  REQUIRE_FALSE(sentinel::ParseRequestHead("GARBAGE\r\n", &head));
  REQUIRE_FALSE(sentinel::ParseRequestHead("GET /healthz\r\n", &head));
}

TEST_CASE("ListProfiles returns sorted YAML stems", "[http][profiles]") {
  ProfileDir dir;
  auto names = sentinel::ListProfiles(dir.str());
  REQUIRE(names == std::vector<std::string>{"finance", "strict"});
  REQUIRE(sentinel::ListProfiles("/nonexistent/profiles").empty());
}

TEST_CASE("ResolveProfilePath finds plain names", "[http][profiles]") {
  ProfileDir dir;
  std::string path;
  std::string error;
  REQUIRE(sentinel::ResolveProfilePath(dir.str(), "finance", &path, &error));
  REQUIRE(fs::path(path).filename().string() == "finance.yaml");
  REQUIRE(sentinel::ResolveProfilePath(dir.str(), "strict", &path, &error));
  REQUIRE(fs::path(path).filename().string() == "strict.yml");
  REQUIRE(
      sentinel::ResolveProfilePath(dir.str(), "finance.yaml", &path, &error));
  REQUIRE(fs::path(path).filename().string() == "finance.yaml");
}

TEST_CASE("ResolveProfilePath rejects traversal and unknown names",
          "[http][profiles]") {
  ProfileDir dir;
  std::string path;
  std::string error;

  REQUIRE_FALSE(sentinel::ResolveProfilePath(dir.str(), "", &path, &error));
  REQUIRE(error == "profile_name is required");

  for (const char* name : {"../etc/passwd", "..", "a/b", "a\\b", ".hidden"}) {
    INFO(name);
    REQUIRE_FALSE(sentinel::ResolveProfilePath(dir.str(), name, &path, &error));
    REQUIRE(error == std::string("invalid profile_name: ") + name);
  }

  REQUIRE_FALSE(
      sentinel::ResolveProfilePath(dir.str(), "missing", &path, &error));
  REQUIRE(error == "profile not found: missing");
  REQUIRE_FALSE(sentinel::ResolveProfilePath(dir.str(), "notes", &path, &error));
  REQUIRE_FALSE(
      sentinel::ResolveProfilePath(dir.str(), "nested.yaml", &path, &error));
}

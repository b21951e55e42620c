#include "llmb/core/hub_client.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace llmb::core {
namespace {

size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t totalSize = size * nmemb;
  auto *file = static_cast<std::ofstream *>(userp);
  file->write(static_cast<char *>(contents), totalSize);
  return totalSize;
}

// Model ids look like "org/name"; keep them one directory level deep.
std::string sanitize(const std::string &text) {
  std::string result;
  for (char ch : text) {
    if (ch == '/')
      result += "--";
    else if (ch == '\\' || ch == ':')
      result += '_';
    else
      result += ch;
  }
  if (result.empty() || result == "." || result == "..")
    result = "_" + result;
  return result;
}

} // namespace

HubClient::HubClient(std::string endpoint, std::filesystem::path cacheDir)
    : endpoint_(std::move(endpoint)), cacheDir_(std::move(cacheDir)) {
  while (!endpoint_.empty() && endpoint_.back() == '/')
    endpoint_.pop_back();
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

HubClient::~HubClient() { curl_global_cleanup(); }

std::string HubClient::defaultEndpoint() {
  if (const char *env = std::getenv("LLMB_HUB_ENDPOINT"); env && *env)
    return env;
  return "https://huggingface.co";
}

std::filesystem::path HubClient::defaultCacheDir() {
  std::filesystem::path cacheHome;
  if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
    cacheHome = xdg;
  else if (const char *home = std::getenv("HOME"); home && *home)
    cacheHome = std::filesystem::path(home) / ".cache";
  else
    cacheHome = std::filesystem::temp_directory_path();
  return cacheHome / "llmbuild" / "hub";
}

std::filesystem::path
HubClient::configDirFor(const std::string &modelId,
                        const std::string &revision) const {
  return cacheDir_ / sanitize(modelId) / sanitize(revision);
}

std::string HubClient::configUrl(const std::string &modelId,
                                 const std::string &revision) const {
  return endpoint_ + "/" + modelId + "/resolve/" + revision + "/config.json";
}

std::optional<std::filesystem::path>
HubClient::fetchConfig(const std::string &modelId, const std::string &revision,
                       std::string *errorMessage) const {
  const auto dir = configDirFor(modelId, revision);
  const auto destination = dir / "config.json";
  std::error_code ec;
  if (std::filesystem::is_regular_file(destination, ec))
    return dir;

  std::filesystem::create_directories(dir, ec);
  if (ec) {
    if (errorMessage)
      *errorMessage = "Failed to create " + dir.string() + ": " + ec.message();
    return std::nullopt;
  }

  auto tempDestination = destination;
  tempDestination += ".part." + std::to_string(::getpid());

  if (!downloadFile(configUrl(modelId, revision), tempDestination,
                    errorMessage))
    return std::nullopt;

  std::filesystem::rename(tempDestination, destination, ec);
  if (ec) {
    if (errorMessage)
      *errorMessage = "Failed to move downloaded file: " + ec.message();
    std::filesystem::remove(tempDestination, ec);
    return std::nullopt;
  }
  return dir;
}

bool HubClient::downloadFile(const std::string &url,
                             const std::filesystem::path &destination,
                             std::string *errorMessage) const {
  CURL *curl = curl_easy_init();
  if (!curl) {
    if (errorMessage)
      *errorMessage = "Failed to initialize CURL";
    return false;
  }

  std::ofstream file(destination, std::ios::binary);
  if (!file.is_open()) {
    curl_easy_cleanup(curl);
    if (errorMessage)
      *errorMessage = "Failed to open destination file: " + destination.string();
    return false;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "llmbuild/1.0");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode res = curl_easy_perform(curl);
  file.close();

  long responseCode = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);

  bool success = (res == CURLE_OK && responseCode == 200);

  if (!success && errorMessage) {
    if (res != CURLE_OK) {
      const char *curlError = curl_easy_strerror(res);
      *errorMessage = curlError ? std::string(curlError) : "unknown curl error";
    } else {
      *errorMessage = "HTTP error " + std::to_string(responseCode) +
                      " fetching " + url;
    }
  }

  curl_easy_cleanup(curl);

  if (!success) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
  }

  return success;
}

} // namespace llmb::core

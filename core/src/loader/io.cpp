#include "loader_internal.h"

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#ifdef ARBITER_USE_CURL
#include <curl/curl.h>
#endif

#include "util/string_util.h"

namespace arbiter::loader_internal {

/// Reads a whole tree or inputs document from disk.
/// MUST throw std::runtime_error (never AuthoringError) when the file cannot be opened.
std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool is_url(const std::string& location) {
  return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
}

#ifdef ARBITER_USE_CURL
namespace {

struct CurlCleanup {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlHandle = std::unique_ptr<CURL, CurlCleanup>;

/// Collects the response body of a tree fetch.
/// MUST report every byte as consumed; a short count aborts the transfer.
size_t append_body(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
  return total;
}

// "Application/JSON; charset=utf-8" -> "application/json"
std::string media_type(const char* raw) {
  if (!raw) return "";
  std::string value(raw);
  return util::to_lower(util::trim_ws(value.substr(0, value.find(';'))));
}

/// Accepts JSON bodies and plain text served by static file hosts.
/// A missing header is tolerated; anything else throws.
void require_json_body(CURL* curl) {
  const char* raw = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &raw) != CURLE_OK) {
    throw std::runtime_error("Failed to read Content-Type for URL");
  }
  std::string type = media_type(raw);
  if (type.empty() || type == "application/json" || type == "text/json" ||
      type == "text/plain") {
    return;
  }
  throw std::runtime_error("Unsupported Content-Type for tree fetch: " + type);
}

}  // namespace
#endif

/// Downloads a tree document. Redirects are followed; HTTP status >= 400
/// and transport failures throw std::runtime_error.
/// MUST throw when the build has no libcurl support.
std::string fetch_url(const std::string& url, int timeout_ms) {
#ifdef ARBITER_USE_CURL
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  std::string body;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "arbiter/0.1");
  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    throw std::runtime_error("Failed to fetch URL: HTTP " + std::to_string(status));
  }
  require_json_body(curl.get());
  return body;
#else
  (void)url;
  (void)timeout_ms;
  throw std::runtime_error("URL fetching is disabled (libcurl not available)");
#endif
}

}  // namespace arbiter::loader_internal

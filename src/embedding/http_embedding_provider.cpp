#include "takoa/embedding/http_embedding_provider.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <memory>

namespace takoa::embedding {

namespace {

std::size_t write_callback(char* contents, std::size_t size, std::size_t nmemb, void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(contents, size * nmemb);
  return size * nmemb;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

HttpEmbeddingProvider::HttpEmbeddingProvider(HttpEmbeddingConfig config)
    : config_(std::move(config)) {}

std::string build_embedding_request(const std::string& model, std::string_view text) {
  nlohmann::json body;
  body["input"] = std::string(text);
  body["model"] = model;
  return body.dump();
}

core::Result<vector::Vector, std::string> parse_embedding_response(const std::string& body,
                                                                   const std::size_t dimension) {
  using R = core::Result<vector::Vector, std::string>;

  try {
    const auto j = nlohmann::json::parse(body);
    if (j.contains("error")) {
      return R::err("embedding API error: " + j["error"].dump());
    }
    const auto& values = j.at("data").at(0).at("embedding");
    if (!values.is_array() || values.size() < dimension) {
      return R::err("embedding response has fewer than " + std::to_string(dimension) +
                    " components");
    }

    vector::Vector out(dimension);
    for (std::size_t i = 0; i < dimension; ++i) {
      out[i] = values[i].get<float>();
    }
    return R::ok(vector::normalize(out));
  } catch (const nlohmann::json::exception& e) {
    return R::err(std::string("malformed embedding response: ") + e.what());
  }
}

core::Result<vector::Vector, std::string> HttpEmbeddingProvider::embed_text(
    std::string_view text) const {
  using R = core::Result<vector::Vector, std::string>;

  if (config_.api_key.empty()) {
    return R::err("no API key configured for " + config_.endpoint);
  }

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    return R::err("curl_easy_init failed");
  }

  curl_slist* raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + config_.api_key).c_str());
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  const std::string request = build_embedding_request(config_.model, text);
  std::string response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, config_.endpoint.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    return R::err(std::string("embedding request failed: ") + curl_easy_strerror(rc));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    return R::err("embedding endpoint returned HTTP " + std::to_string(status));
  }

  return parse_embedding_response(response, config_.dimension);
}

}  // namespace takoa::embedding

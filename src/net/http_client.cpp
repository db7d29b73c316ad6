#include "switchboard/net/http_client.hpp"

#include "switchboard/common/fs.hpp"

#include <curl/curl.h>

#include <memory>

namespace switchboard::net {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

std::string escape(CURL *curl, const std::string &value) {
  char *escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) {
    return "";
  }
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

std::string encode_form(CURL *curl, const FormFields &fields) {
  std::string body;
  for (const auto &[name, value] : fields) {
    if (!body.empty()) {
      body.push_back('&');
    }
    body += escape(curl, name);
    body.push_back('=');
    body += escape(curl, value);
  }
  return body;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_form(const std::string &url, const FormFields &fields,
                                       const PostOptions &options) {
  HttpResponse response;

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
  CURL *curl = handle.get();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  const std::string body = encode_form(curl, fields);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "switchboard/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  if (options.tls_insecure) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  struct curl_slist *header_list =
      curl_slist_append(nullptr, "Content-Type: application/x-www-form-urlencoded");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error_message = curl_easy_strerror(code);
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  curl_slist_free_all(header_list);
  return response;
}

} // namespace switchboard::net

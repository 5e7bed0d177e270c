// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once
#include <curl/curl.h>
#include <stddef.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::string;
using std::runtime_error;
using std::vector;

namespace utils {

const char USER_AGENT[] = "curbside/1.0";

// Status code and body of one HTTP exchange
struct HttpResponse {
    long status = 0;
    string body;
};

// Interface for HTTP client (allows mocking in tests)
struct IHttpClient {
    virtual ~IHttpClient() = default;
    virtual HttpResponse get(const string& url) = 0;
};

// IHttpClient over libcurl; one easy handle per request
class CurlHttpClient : public IHttpClient {
 public:
    explicit CurlHttpClient(long timeoutSeconds = 300) : timeoutSeconds_(timeoutSeconds) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // sent with every request, e.g. "X-App-Token: abc"
    void addHeader(const string& header) { headers_.push_back(header); }

    // GET with the configured headers, following redirects
    //
    // Args:
    //    url: absolute URL
    // Returns:
    //    status code and body; HTTP error codes are not exceptions
    // Throws:
    //    runtime_error on transport failure
    HttpResponse get(const string& url) override {
        CURL* curl = curl_easy_init();
        if (!curl) throw runtime_error("curl_easy_init failed");

        curl_slist* headerList = nullptr;
        for (const auto& h : headers_) headerList = curl_slist_append(headerList, h.c_str());

        string buffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
        if (headerList) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);

        const CURLcode res = curl_easy_perform(curl);
        HttpResponse resp;
        if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
        curl_slist_free_all(headerList);
        curl_easy_cleanup(curl);
        if (res != CURLE_OK) throw runtime_error(string("CURL error for ") + url + ": " + curl_easy_strerror(res));

        resp.body = std::move(buffer);
        return resp;
    }

 private:
    static size_t appendBody(void* contents, size_t size, size_t nmemb, void* userData) {
        const size_t total = size * nmemb;
        static_cast<string*>(userData)->append(static_cast<char*>(contents), total);
        return total;
    }

    long timeoutSeconds_;
    vector<string> headers_;
};

}  // namespace utils

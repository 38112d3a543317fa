#pragma once

#include <curl/curl.h>

#include <filesystem>
#include <memory>
#include <string>

namespace util {

struct CurlEasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

// Process-wide curl_global_init/curl_global_cleanup pair. One instance lives in main().
class CurlGlobal {
public:
    CurlGlobal() noexcept : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (ok_) {
            curl_global_cleanup();
        }
    }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const noexcept { return ok_; }

private:
    bool ok_;
};

struct HttpAuth {
    std::string user;
    std::string password;
};

// GET `url` into `body`. HTTP status >= 400 is a failure.
bool http_get_to_string(const std::string& url, const HttpAuth& auth,
                        std::string& body, std::string& error);

// GET `url` into `dest` (truncated). A partial file is removed on failure.
bool http_get_to_file(const std::string& url, const HttpAuth& auth,
                      const std::filesystem::path& dest, std::string& error);

} // namespace util

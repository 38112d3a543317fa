#include "util/curl_easy.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>

#include "util/log.hpp"

namespace util {
namespace {

std::size_t append_to_string(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::size_t append_to_file(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<std::FILE*>(userdata)) * size;
}

// Common options for an authenticated GET; the caller sets the write target.
bool prepare_get(CURL* h, const std::string& url, const HttpAuth& auth, char* errbuf) {
    errbuf[0] = '\0';
    bool ok = curl_easy_setopt(h, CURLOPT_URL, url.c_str()) == CURLE_OK;
    ok = ok && curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf) == CURLE_OK;
    ok = ok && curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L) == CURLE_OK;
    ok = ok && curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L) == CURLE_OK;
    ok = ok && curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L) == CURLE_OK;
    if (ok && !auth.user.empty()) {
        ok = curl_easy_setopt(h, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC)) == CURLE_OK &&
             curl_easy_setopt(h, CURLOPT_USERNAME, auth.user.c_str()) == CURLE_OK &&
             curl_easy_setopt(h, CURLOPT_PASSWORD, auth.password.c_str()) == CURLE_OK;
    }
    return ok;
}

std::string describe(CURLcode rc, const char* errbuf, const std::string& url) {
    std::string out = url + ": ";
    out += (errbuf && errbuf[0] != '\0') ? errbuf : curl_easy_strerror(rc);
    return out;
}

} // namespace

bool http_get_to_string(const std::string& url, const HttpAuth& auth,
                        std::string& body, std::string& error) {
    CurlEasy h(curl_easy_init());
    if (!h) {
        error = "curl_easy_init failed";
        return false;
    }
    char errbuf[CURL_ERROR_SIZE];
    if (!prepare_get(h.get(), url, auth, errbuf)) {
        error = url + ": failed to set transfer options";
        return false;
    }
    body.clear();
    if (curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, &append_to_string) != CURLE_OK ||
        curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &body) != CURLE_OK) {
        error = url + ": failed to set write target";
        return false;
    }
    const CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK) {
        error = describe(rc, errbuf, url);
        return false;
    }
    return true;
}

bool http_get_to_file(const std::string& url, const HttpAuth& auth,
                      const std::filesystem::path& dest, std::string& error) {
    CurlEasy h(curl_easy_init());
    if (!h) {
        error = "curl_easy_init failed";
        return false;
    }
    char errbuf[CURL_ERROR_SIZE];
    if (!prepare_get(h.get(), url, auth, errbuf)) {
        error = url + ": failed to set transfer options";
        return false;
    }
    std::FILE* f = std::fopen(dest.c_str(), "wb");
    if (!f) {
        error = "open " + dest.string() + ": " + std::error_code(errno, std::generic_category()).message();
        return false;
    }
    CURLcode rc = CURLE_OK;
    if (curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, &append_to_file) != CURLE_OK ||
        curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, f) != CURLE_OK) {
        rc = CURLE_FAILED_INIT;
        errbuf[0] = '\0';
    } else {
        rc = curl_easy_perform(h.get());
    }
    const bool closed = std::fclose(f) == 0;
    if (rc != CURLE_OK || !closed) {
        error = rc != CURLE_OK ? describe(rc, errbuf, url) : "close " + dest.string() + " failed";
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        if (ec) {
            util::log(util::LogLevel::Warn, "partial download %s left behind: %s",
                      dest.string().c_str(), ec.message().c_str());
        }
        return false;
    }
    return true;
}

} // namespace util

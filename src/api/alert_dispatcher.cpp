#include "api/alert_dispatcher.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <utility>

#include "util/curl_easy.hpp"
#include "util/log.hpp"

namespace api {
namespace {

struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using Slist = std::unique_ptr<curl_slist, SlistDeleter>;

struct UploadCursor {
    const std::string* data;
    std::size_t offset;
};

std::size_t read_payload(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    auto* cur = static_cast<UploadCursor*>(userdata);
    const std::size_t room = size * nitems;
    const std::size_t left = cur->data->size() - cur->offset;
    const std::size_t n = std::min(room, left);
    std::memcpy(buffer, cur->data->data() + cur->offset, n);
    cur->offset += n;
    return n;
}

} // namespace

CurlSmtpTransport::CurlSmtpTransport(core::AlertConfig cfg) : cfg_(std::move(cfg)) {}

std::string CurlSmtpTransport::render_payload(const MailMessage& msg) const {
    std::string out;
    out += "From: " + msg.sender + " <" + cfg_.account + ">\r\n";
    out += "To: " + msg.recipient + "\r\n";
    out += "Subject: " + msg.subject + "\r\n";
    out += "Content-Type: text/plain; charset=utf-8\r\n";
    out += "\r\n";
    out += msg.body + "\r\n";
    return out;
}

bool CurlSmtpTransport::send(const MailMessage& msg, std::string& error) {
    util::CurlEasy h(curl_easy_init());
    if (!h) {
        error = "curl_easy_init failed";
        return false;
    }
    const std::string url = "smtp://" + cfg_.smtp_server + ":" + std::to_string(cfg_.smtp_port);
    const std::string from = "<" + cfg_.account + ">";
    Slist rcpt(curl_slist_append(nullptr, ("<" + msg.recipient + ">").c_str()));
    if (!rcpt) {
        error = "failed to build recipient list";
        return false;
    }
    const std::string payload = render_payload(msg);
    UploadCursor cursor{&payload, 0};
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    bool ok = curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str()) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errbuf) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL)) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_USERNAME, cfg_.account.c_str()) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_PASSWORD, cfg_.password.c_str()) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_MAIL_FROM, from.c_str()) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_MAIL_RCPT, rcpt.get()) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_READFUNCTION, &read_payload) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_READDATA, &cursor) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_UPLOAD, 1L) == CURLE_OK;
    ok = ok && curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L) == CURLE_OK;
    if (!ok) {
        error = "failed to set SMTP options";
        return false;
    }
    const CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK) {
        error = url + ": " + (errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(rc)));
        return false;
    }
    return true;
}

AlertText compose_alert(const std::string& system_name,
                        const core::CycleClock& clock,
                        const core::StateResolution& res) {
    const std::string when = util::state_stamp(clock.current);
    const std::string start = util::state_stamp(clock.system_start);
    switch (res.start_class) {
    case core::StartClass::Cold:
        return {system_name + " failed for " + when,
                "Missing states from " + util::state_stamp(res.earliest_checked) + " to " + start +
                    ". Starting model with cold states."};
    case core::StartClass::Degraded:
        return {system_name + " warning for " + when,
                "Using states from " + util::state_stamp(res.resolved_start) + " instead of " + start + "."};
    case core::StartClass::Warm:
        break;
    }
    return {};
}

AlertDispatcher::AlertDispatcher(core::AlertConfig cfg, std::string system_name,
                                 std::unique_ptr<IMailTransport> transport)
    : cfg_(std::move(cfg)), system_name_(std::move(system_name)), transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_unique<CurlSmtpTransport>(cfg_);
    }
}

AlertStats AlertDispatcher::dispatch(const core::CycleClock& clock, const core::StateResolution& res) {
    AlertStats stats{};
    if (!res.needs_alert()) {
        return stats;
    }
    if (!cfg_.enabled) {
        util::log(util::LogLevel::Info, "Alerts disabled, not reporting %s start",
                  core::start_class_name(res.start_class));
        return stats;
    }
    const AlertText text = compose_alert(system_name_, clock, res);
    for (const auto& to : cfg_.recipients) {
        MailMessage msg{cfg_.sender, to, text.subject, text.body};
        std::string err;
        if (transport_->send(msg, err)) {
            ++stats.sent;
            util::log(util::LogLevel::Info, "Alert sent to %s: %s", to.c_str(), text.subject.c_str());
        } else {
            ++stats.failed;
            util::log(util::LogLevel::Warn, "Alert to %s failed: %s", to.c_str(), err.c_str());
        }
    }
    return stats;
}

} // namespace api

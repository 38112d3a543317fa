#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/cycle_clock.hpp"
#include "core/cycle_config.hpp"
#include "core/state_resolver.hpp"

namespace api {

struct MailMessage {
    std::string sender;      // display name
    std::string recipient;
    std::string subject;
    std::string body;
};

class IMailTransport {
public:
    virtual ~IMailTransport() = default;
    // Returns false and fills `error` when the message could not be handed off.
    virtual bool send(const MailMessage& msg, std::string& error) = 0;
};

// SMTP submission with STARTTLS and LOGIN/PLAIN auth through libcurl.
class CurlSmtpTransport : public IMailTransport {
public:
    explicit CurlSmtpTransport(core::AlertConfig cfg);
    bool send(const MailMessage& msg, std::string& error) override;

    // RFC 5322 payload that is uploaded for `msg`.
    std::string render_payload(const MailMessage& msg) const;

private:
    core::AlertConfig cfg_;
};

struct AlertStats {
    std::uint64_t sent{0};
    std::uint64_t failed{0};
};

struct AlertText {
    std::string subject;
    std::string body;
};

// Subject and body for a cold or degraded start. Warm starts yield an empty text.
[[nodiscard]] AlertText compose_alert(const std::string& system_name,
                                      const core::CycleClock& clock,
                                      const core::StateResolution& res);

// Notifies every configured recipient of a cold or degraded start. Delivery failures
// are logged and counted, never propagated.
class AlertDispatcher {
public:
    AlertDispatcher(core::AlertConfig cfg, std::string system_name,
                    std::unique_ptr<IMailTransport> transport = nullptr);

    AlertStats dispatch(const core::CycleClock& clock, const core::StateResolution& res);

private:
    core::AlertConfig cfg_;
    std::string system_name_;
    std::unique_ptr<IMailTransport> transport_;
};

} // namespace api

#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "api/alert_dispatcher.hpp"
#include "api/forecast_cycle.hpp"
#include "ingest/nowcast_adapter.hpp"
#include "tests/harness/fake_remote_archive.hpp"
#include "tests/harness/temp_tree.hpp"

namespace test {

// Writes every requested forecast frame, or fails when told to.
class FakePredictor : public ingest::INowcastPredictor {
public:
    bool fails{false};
    std::vector<ingest::PredictRequest> requests;

    ingest::PredictResult predict(const ingest::PredictRequest& req) override {
        requests.push_back(req);
        if (fails) {
            return {false, "predictor exit=1"};
        }
        for (const auto ts : core::cadence_grid(req.start, req.end)) {
            put_precip(req.output_dir, core::PrecipKind::Forecast, ts, "predicted");
        }
        return {true, {}};
    }
};

class FakeMail : public api::IMailTransport {
public:
    std::set<std::string> refuse;
    std::vector<api::MailMessage> sent;

    bool send(const api::MailMessage& msg, std::string& error) override {
        if (refuse.count(msg.recipient) != 0) {
            error = "550 rejected";
            return false;
        }
        sent.push_back(msg);
        return true;
    }
};

// Fakes handed to a cycle, with raw handles kept for assertions.
struct FakeCollaborators {
    FakeCollaborators()
        : remote_owner(std::make_unique<FakeRemoteArchive>()),
          predictor_owner(std::make_unique<FakePredictor>()),
          mail_owner(std::make_unique<FakeMail>()),
          remote(remote_owner.get()),
          predictor(predictor_owner.get()),
          mail(mail_owner.get()) {}

    api::CycleCollaborators release() {
        return {std::move(remote_owner), std::move(predictor_owner), std::move(mail_owner)};
    }

    std::unique_ptr<FakeRemoteArchive> remote_owner;
    std::unique_ptr<FakePredictor> predictor_owner;
    std::unique_ptr<FakeMail> mail_owner;
    FakeRemoteArchive* remote;
    FakePredictor* predictor;
    FakeMail* mail;
};

} // namespace test

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_TESTFIXTURES_HXX
#define BLYNKCTL_TESTFIXTURES_HXX

#include "config/AppConfig.hxx"
#include "http/HttpClient.hxx"

namespace blynkCtl::test
{
    static constexpr char SERVER[] = "http://blynk.test";

    // Two groups with an active-low device each, a sensor inside the kitchen
    // group and an ungrouped sensor.
    inline AppConfig makeHomeConfig() {
        AppConfig cfg;
        cfg.server = SERVER;
        cfg.devices = {
            {"bedroom_light", "V3", "tokA", 0, "bedroom"},
            {"kitchen_light", "d2", "tokB", 1, "kitchen"},
            {"kitchen_fan",   "V7", "tokB", 0, "kitchen"},
            {"bedroom_lamp",  "V4", "tokA", 1, "bedroom"},
            {"temperature",   "V6", "tokC", std::nullopt, "kitchen"},
            {"humidity",      "V5", "tokC", std::nullopt, std::nullopt},
        };
        cfg.exclude = {"temperature", "humidity"};
        cfg.groups = {"bedroom", "kitchen", "garage"};
        return cfg;
    }

    inline std::string getUrl(const std::string& auth, const std::string& pin) {
        return std::string(SERVER) + "/" + auth + "/get/" + pin;
    }

    inline std::string updateUrl(const std::string& auth, const std::string& pin, const std::string& value) {
        return std::string(SERVER) + "/" + auth + "/update/" + pin + "?value=" + value;
    }

    // Scripted transport: canned replies per URL, every request recorded.
    // Unscripted URLs answer 200 with an empty body, like a Blynk update.
    class FakeTransport final : public HttpTransport {
    public:
        struct Reply {
            BlynkErr err{BlynkErr::Ok};
            HttpResponse response{};
        };

        BlynkErr get(const std::string& url, HttpResponse& out) override {
            requests.push_back(url);
            if (const auto it = replies.find(url); it != replies.end()) {
                out = it->second.response;
                return it->second.err;
            }
            out = HttpResponse{200, ""};
            return BlynkErr::Ok;
        }

        void reply(const std::string& url, const std::string& body, const unsigned status = 200) {
            replies[url] = Reply{BlynkErr::Ok, HttpResponse{status, body}};
        }

        void fail(const std::string& url, const BlynkErr err) {
            replies[url] = Reply{err, HttpResponse{}};
        }

        [[nodiscard]] bool requested(const std::string& url) const {
            return std::ranges::find(requests, url) != requests.end();
        }

        std::map<std::string, Reply> replies;
        std::vector<std::string> requests;
    };
}

#endif //BLYNKCTL_TESTFIXTURES_HXX

#include <vector>

#include "../../health/health_registry.hpp"
#include "../../provider/provider_registry.hpp"
#include "../../router/language_router.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace coderun {
namespace http {

//=============================================================================
// GET /v0/providers/health
//=============================================================================
void HttpServer::handle_get_providers_health(const httplib::Request &, httplib::Response &res) {
    nlohmann::json providers_json = nlohmann::json::array();
    size_t available_count = 0;

    for (const auto &descriptor : provider_registry_.descriptors()) {
        auto record = health_.snapshot(descriptor.name);
        bool demoted = health_.is_demoted(descriptor.name);
        if (!demoted) {
            ++available_count;
        }

        auto entry = encode_descriptor(descriptor);
        entry["health"] = encode_health_record(record);
        entry["demoted"] = demoted;
        providers_json.push_back(entry);
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"failureThreshold", health_.failure_threshold()},
                               {"availableCount", available_count},
                               {"providers", providers_json}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/languages
//=============================================================================
void HttpServer::handle_get_languages(const httplib::Request &, httplib::Response &res) {
    nlohmann::json languages_json = nlohmann::json::array();
    for (const auto &language : router_.supported_languages()) {
        std::vector<std::string> served_by;
        router::Resolution resolution;
        std::string error;
        if (router_.resolve(language, resolution, error)) {
            for (const auto &candidate : resolution.candidates) {
                served_by.push_back(candidate.name);
            }
        }
        languages_json.push_back({{"language", language}, {"providers", served_by}});
    }

    nlohmann::json aliases_json = nlohmann::json::object();
    for (const auto &[alias, canonical] : router_.aliases()) {
        aliases_json[alias] = canonical;
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"languages", languages_json}, {"aliases", aliases_json}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace coderun

#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace coderun
{
    namespace http
    {

        // Helper: Send JSON response. Captured program output is not guaranteed
        // to be UTF-8, so invalid sequences are replaced rather than thrown on.
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
        }

    } // namespace http
} // namespace coderun

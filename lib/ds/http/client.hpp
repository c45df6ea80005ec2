/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_HTTP_CLIENT_HPP
#define DELEGATION_SCOUT_HTTP_CLIENT_HPP

#include <chrono>
#include <string>
#include <ds/common/error.hpp>

namespace delegation_scout::http {
    struct response {
        unsigned status = 0;
        std::string body {};

        [[nodiscard]] bool ok() const noexcept
        {
            return status >= 200 && status < 300;
        }
    };

    struct url_parts {
        bool tls = false;
        std::string host {};
        std::string port {};
        std::string target {};
    };

    // http and https URLs only; the target is the path and the query, "/" when the path is empty
    extern url_parts parse_url(const std::string &url);

    // One request per connection: each call resolves, connects, exchanges and closes.
    // Transport failures and timeouts throw network_error; any HTTP status is returned as is.
    struct client {
        explicit client(std::chrono::milliseconds timeout=std::chrono::milliseconds { 30000 });
        [[nodiscard]] response post(const std::string &url, const std::string &body, std::string_view content_type="application/json") const;
    private:
        std::chrono::milliseconds _timeout;
    };
}

#endif // !DELEGATION_SCOUT_HTTP_CLIENT_HPP

#pragma once

#include "../error.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

std::expected<HttpResponse, Error> http_post(const std::string& url,
                                             const std::vector<std::string>& headers,
                                             const std::string& body,
                                             long timeout_s = 30);

// Percent-encodes a query-string component.
std::string url_encode(std::string_view value);

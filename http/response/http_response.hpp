#ifndef TRELLIS_HTTP_RESPONSE_HPP
#define TRELLIS_HTTP_RESPONSE_HPP

#include "http/constants/http_constants.hpp"
#include "http/headers/http_headers.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

// To keep naming consistent :)
using Json = nlohmann::json;

namespace Trellis::Http {

struct HttpResponse {
    HttpStatus  status = HttpStatus::OK;
    HttpHeaders headers;
    std::string body;

    // Setters
    HttpResponse& Status(HttpStatus code);
    HttpResponse& Set(std::string_view key, std::string_view value);

    // Senders
    void SendText(std::string_view text);
    void SendJson(const Json& json);

    // Plain text body carrying the reason phrase, what the router answers with by default
    void SendStatus(HttpStatus code);
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_RESPONSE_HPP

#include "http_response.hpp"

namespace Trellis::Http {

// vvv Setters vvv
HttpResponse& HttpResponse::Status(HttpStatus code)
{
    status = code;
    return *this;
}

HttpResponse& HttpResponse::Set(std::string_view key, std::string_view value)
{
    headers.SetHeader(key, value);
    return *this;
}

// vvv Senders vvv
void HttpResponse::SendText(std::string_view text)
{
    headers.SetHeader("Content-Type", "text/plain; charset=utf-8");
    body = text;
}

void HttpResponse::SendJson(const Json& json)
{
    headers.SetHeader("Content-Type", "application/json");
    body = json.dump();
}

void HttpResponse::SendStatus(HttpStatus code)
{
    status = code;
    SendText(HttpStatusToReason(code));
}

} // namespace Trellis::Http

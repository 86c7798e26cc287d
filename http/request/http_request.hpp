#ifndef TRELLIS_HTTP_REQUEST_HPP
#define TRELLIS_HTTP_REQUEST_HPP

#include "http/headers/http_headers.hpp"
#include "http/routing/route_params.hpp"

#include <string>

namespace Trellis::Http {

struct HttpRequest {
    std::string method;
    std::string path;
    HttpHeaders headers;

    // Filled by the router right before the handler runs
    RouteParams params;
    std::string version;
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_REQUEST_HPP

#ifndef TRELLIS_HTTP_HEADERS_HPP
#define TRELLIS_HTTP_HEADERS_HPP

#include <string>
#include <string_view>
#include <unordered_map>

namespace Trellis::Http {

// Requests are assembled by the caller, so unlike a parser-backed map we own the strings
using KeyType      = std::string;
using ConstKeyType = std::string_view;

struct CaseInsensitiveHash {
    size_t operator()(ConstKeyType key) const;
};

struct CaseInsensitiveEqual {
    bool operator()(ConstKeyType lhs, ConstKeyType rhs) const;
};

using HttpHeaderMap = std::unordered_map<KeyType, KeyType, CaseInsensitiveHash, CaseInsensitiveEqual>;

// === HttpHeaders class === //
class HttpHeaders {
public:
    HttpHeaders() = default;

    void             SetHeader(ConstKeyType key, ConstKeyType value);
    bool             HasHeader(ConstKeyType key) const;
    std::string_view GetHeader(ConstKeyType key) const;
    void             RemoveHeader(ConstKeyType key);
    void             Clear();
    std::size_t      Size() const;

    const HttpHeaderMap& GetHeaderMap() const;

private:
    HttpHeaderMap headers_;
};

// Version token carried by a content-negotiation header, e.g. with prefix "application/vnd."
// "application/vnd.v2" yields "v2". Text after the LAST occurrence of 'prefix', empty if absent.
std::string_view ExtractVersionToken(std::string_view headerValue, std::string_view prefix);

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_HEADERS_HPP

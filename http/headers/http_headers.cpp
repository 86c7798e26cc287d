#include "http_headers.hpp"

#include <cctype>

namespace Trellis::Http {

std::size_t CaseInsensitiveHash::operator()(ConstKeyType key) const
{
    constexpr std::size_t fnvPrime       = 1099511628211ULL;
    constexpr std::size_t fnvOffsetBasis = 14695981039346656037ULL;

    std::size_t hash = fnvOffsetBasis;
    for(char c : key) {
        hash ^= static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
        hash *= fnvPrime;
    }

    return hash;
}

bool CaseInsensitiveEqual::operator()(ConstKeyType lhs, ConstKeyType rhs) const
{
    if(lhs.size() != rhs.size()) return false;

    for(std::size_t i = 0; i < lhs.size(); ++i)
        if(std::tolower(static_cast<unsigned char>(lhs[i])) !=
           std::tolower(static_cast<unsigned char>(rhs[i])))
            return false;

    return true;
}

// === HttpHeaders Methods === //
void HttpHeaders::SetHeader(ConstKeyType key, ConstKeyType value)
{
    auto it = headers_.find(std::string(key));
    if(it != headers_.end())
        it->second = std::string(value);
    else
        headers_.emplace(std::string(key), std::string(value));
}

bool HttpHeaders::HasHeader(ConstKeyType key) const
{
    return headers_.find(std::string(key)) != headers_.end();
}

std::string_view HttpHeaders::GetHeader(ConstKeyType key) const
{
    auto it = headers_.find(std::string(key));
    return (it != headers_.end()) ? std::string_view{it->second} : std::string_view{};
}

void HttpHeaders::RemoveHeader(ConstKeyType key)
{
    headers_.erase(std::string(key));
}

void HttpHeaders::Clear()
{
    headers_.clear();
}

std::size_t HttpHeaders::Size() const
{
    return headers_.size();
}

const HttpHeaderMap& HttpHeaders::GetHeaderMap() const
{
    return headers_;
}

// vvv Content negotiation vvv
std::string_view ExtractVersionToken(std::string_view headerValue, std::string_view prefix)
{
    if(prefix.empty())
        return {};

    std::size_t pos = headerValue.rfind(prefix);
    if(pos == std::string_view::npos)
        return {};

    return headerValue.substr(pos + prefix.size());
}

} // namespace Trellis::Http

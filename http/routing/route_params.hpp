#ifndef TRELLIS_HTTP_ROUTE_PARAMS_HPP
#define TRELLIS_HTTP_ROUTE_PARAMS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Trellis::Http {

/*
 * Ordered (name, value) captures of a single match. Add() never touches 'this',
 * it hands back an extended copy, so whatever a caller already holds stays valid.
 */
class RouteParams {
public:
    using Entry    = std::pair<std::string, std::string>;
    using Storage  = std::vector<Entry>;
    using Iterator = Storage::const_iterator;

public:
    RouteParams() = default;

    RouteParams Add(std::string_view name, std::string_view value) const;

    // Most recently added value for 'name', nullptr if it was never bound
    const std::string*       Get(std::string_view name) const;
    std::vector<std::string> GetAll(std::string_view name) const;
    bool                     Has(std::string_view name) const;

    std::size_t  Size()  const { return entries_.size(); }
    bool         Empty() const { return entries_.empty(); }
    const Entry& At(std::size_t index) const { return entries_.at(index); }

    Iterator begin() const { return entries_.begin(); }
    Iterator end()   const { return entries_.end(); }

private:
    Storage entries_;
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_ROUTE_PARAMS_HPP

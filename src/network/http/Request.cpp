#include "Request.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <utility>

namespace vireo::core {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

Request::Request(std::string method, std::string url, http::fields headers, BodyStream& stream,
                 bool keep_alive)
    : method_(std::move(method)),
      url_(std::move(url)),
      headers_(std::move(headers)),
      stream_(stream),
      keep_alive_(keep_alive) {
    auto parsed = boost::urls::parse_uri_reference(url_);
    if (parsed.has_value()) {
        boost::urls::url_view view = *parsed;
        path_ = std::string(view.encoded_path());
        query_ = std::string(view.encoded_query());
    } else {
        // Not a valid URI; route on the raw target up to the query string.
        auto pos = url_.find('?');
        path_ = url_.substr(0, pos);
        if (pos != std::string::npos) {
            query_ = url_.substr(pos + 1);
        }
    }
    if (path_.empty()) {
        path_ = "/";
    }
}

std::optional<std::string> Request::header(std::string_view name) const {
    auto it = headers_.find(beast::string_view(name.data(), name.size()));
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

std::string Request::host() const { return header("Host").value_or(""); }

std::optional<std::string> Request::param(const std::string& name) const {
    auto it = params_.find(name);
    if (it == params_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> Request::arg(std::string_view name) const {
    auto values = args(name);
    if (values.empty()) {
        return std::nullopt;
    }
    return values.front();
}

std::vector<std::string> Request::args(std::string_view name) const {
    std::vector<std::string> values;
    auto parsed = boost::urls::parse_uri_reference(url_);
    if (!parsed.has_value()) {
        return values;
    }
    for (auto param : parsed->params()) {
        if (param.key == name) {
            values.push_back(param.value);
        }
    }
    return values;
}

const std::map<std::string, std::string>& Request::cookies() const {
    if (cookies_) {
        return *cookies_;
    }

    cookies_.emplace();
    auto header_value = header("Cookie");
    if (!header_value) {
        return *cookies_;
    }

    std::string_view rest = *header_value;
    while (!rest.empty()) {
        auto end = rest.find(';');
        std::string_view item = rest.substr(0, end);
        auto eq = item.find('=');
        if (eq != std::string_view::npos) {
            auto name = Trim(item.substr(0, eq));
            if (!name.empty()) {
                (*cookies_)[std::string(name)] = std::string(item.substr(eq + 1));
            }
        }
        if (end == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(end + 1);
    }
    return *cookies_;
}

}  // namespace vireo::core

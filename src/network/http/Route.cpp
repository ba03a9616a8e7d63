#include "Route.hpp"

#include <boost/url/encode.hpp>
#include <boost/url/rfc/pchars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "Errors.hpp"

namespace vireo::core {

namespace {

bool IsTokenChar(char c) {
    static constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           extra.find(c) != std::string_view::npos;
}

bool IsParamName(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

std::string EscapeRegex(std::string_view text) {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (special.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

}  // namespace

std::string NormalizeMethod(std::string_view method) {
    if (method.empty() || !std::all_of(method.begin(), method.end(), IsTokenChar)) {
        throw RouteConfigurationError("Invalid HTTP method: '" + std::string(method) + "'");
    }
    std::string upper(method);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

MethodSet NormalizeMethods(const std::vector<std::string>& methods) {
    if (methods.empty()) {
        return {"GET"};
    }
    MethodSet result;
    result.reserve(methods.size());
    for (const auto& method : methods) {
        result.push_back(NormalizeMethod(method));
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

PathPattern CompilePath(const std::string& path) {
    std::vector<PathSegment> segments;
    std::vector<std::string> params;
    std::string literal;

    for (std::size_t i = 0; i < path.size(); ++i) {
        const char c = path[i];
        if (c == '}') {
            throw RouteConfigurationError("Unbalanced '}' in route path " + path);
        }
        if (c != '{') {
            literal += c;
            continue;
        }

        auto close = path.find('}', i + 1);
        if (close == std::string::npos) {
            throw RouteConfigurationError("Unterminated '{' in route path " + path);
        }
        std::string name = path.substr(i + 1, close - i - 1);
        if (!IsParamName(name)) {
            throw RouteConfigurationError("Invalid parameter name '" + name + "' in route path " +
                                          path);
        }
        if (std::find(params.begin(), params.end(), name) != params.end()) {
            throw RouteConfigurationError("Duplicated parameter '" + name + "' in route path " +
                                          path);
        }

        if (!literal.empty()) {
            segments.push_back({false, std::move(literal)});
            literal.clear();
        }
        segments.push_back({true, name});
        params.push_back(std::move(name));
        i = close;
    }
    if (!literal.empty()) {
        segments.push_back({false, std::move(literal)});
    }

    if (params.empty()) {
        return LiteralPath{path};
    }

    std::string expression;
    for (const auto& segment : segments) {
        expression += segment.is_param ? std::string("([^/]+)") : EscapeRegex(segment.text);
    }
    return DynamicPath{path, std::move(segments), std::move(params),
                       boost::regex(expression, boost::regex::ECMAScript)};
}

Route::Route(std::string path, Handler handler, RouteOptions options)
    : path_(std::move(path)),
      pattern_(CompilePath(path_)),
      handler_(std::move(handler)),
      methods_(NormalizeMethods(options.methods)),
      hosts_(std::move(options.hosts)),
      name_(std::move(options.name)),
      timeout_(options.timeout) {
    if (!handler_) {
        throw RouteConfigurationError("Route " + path_ + " has no handler");
    }
}

Route::Kind Route::kind() const noexcept {
    return std::holds_alternative<LiteralPath>(pattern_) ? Kind::Literal : Kind::Dynamic;
}

std::optional<PathParams> Route::match(std::string_view path) const {
    switch (kind()) {
        case Kind::Literal:
            if (std::get<LiteralPath>(pattern_).path == path) {
                return PathParams{};
            }
            return std::nullopt;

        case Kind::Dynamic: {
            const auto& dynamic = std::get<DynamicPath>(pattern_);
            boost::match_results<std::string_view::const_iterator> m;
            try {
                if (!boost::regex_match(path.begin(), path.end(), m, dynamic.matcher)) {
                    return std::nullopt;
                }
            } catch (const std::runtime_error& e) {
                // Boost.Regex gives up on pathological input instead of recursing
                spdlog::warn("[Route] {} not matched against a {} byte path: {}", path_,
                             path.size(), e.what());
                return std::nullopt;
            }
            PathParams params;
            for (std::size_t i = 0; i < dynamic.params.size(); ++i) {
                params.emplace(dynamic.params[i], m[i + 1].str());
            }
            return params;
        }
    }
    return std::nullopt;
}

Route Route::with_prefix(std::string_view name_prefix, std::string_view path_prefix) const {
    std::string name = name_;
    if (!name_prefix.empty() && !name.empty()) {
        name = std::string(name_prefix) + ":" + name;
    }
    RouteOptions options{methods_, hosts_, std::move(name), timeout_};
    return Route(std::string(path_prefix) + path_, handler_, std::move(options));
}

std::string Route::build_url(const std::vector<std::string>& args,
                             const std::map<std::string, std::string>& kwargs) const {
    std::string url;
    // Keyword arguments naming a placeholder never spill into the query
    std::set<std::string> path_params;

    switch (kind()) {
        case Kind::Literal:
            if (!args.empty()) {
                throw RouteConfigurationError("Route " + path_ + " takes no positional arguments, " +
                                              std::to_string(args.size()) + " given");
            }
            url = path_;
            break;

        case Kind::Dynamic: {
            std::size_t next_arg = 0;
            for (const auto& segment : std::get<DynamicPath>(pattern_).segments) {
                if (!segment.is_param) {
                    url += segment.text;
                    continue;
                }
                path_params.insert(segment.text);
                if (next_arg < args.size()) {
                    url += boost::urls::encode(args[next_arg++], boost::urls::pchars);
                    continue;
                }
                auto it = kwargs.find(segment.text);
                if (it == kwargs.end()) {
                    throw RouteConfigurationError("Missing value for parameter '" + segment.text +
                                                  "' of route " + path_);
                }
                url += boost::urls::encode(it->second, boost::urls::pchars);
            }
            if (next_arg < args.size()) {
                throw RouteConfigurationError("Route " + path_ + " takes " +
                                              std::to_string(next_arg) + " positional arguments, " +
                                              std::to_string(args.size()) + " given");
            }
            break;
        }
    }

    char separator = '?';
    for (const auto& [key, value] : kwargs) {
        if (path_params.count(key) != 0) {
            continue;
        }
        url += separator;
        url += boost::urls::encode(key, boost::urls::unreserved_chars);
        url += '=';
        url += boost::urls::encode(value, boost::urls::unreserved_chars);
        separator = '&';
    }
    return url;
}

}  // namespace vireo::core

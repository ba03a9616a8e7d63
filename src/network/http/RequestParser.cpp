#include "RequestParser.hpp"

#include <boost/core/ignore_unused.hpp>
#include <utility>

namespace vireo::core {

class RequestParser::Impl : public http::basic_parser<true> {
   public:
    explicit Impl(ParserListener& listener) : listener_(listener) {}

    unsigned int version() const noexcept { return version_; }

   private:
    void on_request_impl(http::verb /*method*/, beast::string_view method_str,
                         beast::string_view target, int version,
                         beast::error_code& /*ec*/) override {
        method_.assign(method_str.data(), method_str.size());
        target_.assign(target.data(), target.size());
        version_ = static_cast<unsigned int>(version);
        fields_.clear();
    }

    void on_response_impl(int code, beast::string_view reason, int version,
                          beast::error_code& ec) override {
        // Request parser: never called by basic_parser<true>.
        boost::ignore_unused(code, reason, version);
        ec = http::error::bad_method;
    }

    void on_field_impl(http::field /*name*/, beast::string_view name_string,
                       beast::string_view value, beast::error_code& /*ec*/) override {
        fields_.insert(name_string, value);
    }

    void on_header_impl(beast::error_code& /*ec*/) override {
        listener_.on_headers_complete(std::move(fields_), std::move(target_), std::move(method_),
                                      upgrade());
        fields_ = {};
    }

    void on_body_init_impl(boost::optional<std::uint64_t> const& /*content_length*/,
                           beast::error_code& /*ec*/) override {}

    std::size_t on_body_impl(beast::string_view body, beast::error_code& /*ec*/) override {
        listener_.on_body(std::string_view(body.data(), body.size()));
        return body.size();
    }

    void on_chunk_header_impl(std::uint64_t /*size*/, beast::string_view /*extensions*/,
                              beast::error_code& /*ec*/) override {}

    std::size_t on_chunk_body_impl(std::uint64_t /*remain*/, beast::string_view body,
                                   beast::error_code& /*ec*/) override {
        listener_.on_body(std::string_view(body.data(), body.size()));
        return body.size();
    }

    void on_finish_impl(beast::error_code& /*ec*/) override { listener_.on_message_complete(); }

    ParserListener& listener_;
    http::fields fields_;
    std::string method_;
    std::string target_;
    unsigned int version_ = 11;  // NOLINT
};

RequestParser::RequestParser(ParserListener& listener, std::size_t header_limit,
                             std::uint64_t body_limit)
    : listener_(listener), header_limit_(header_limit), body_limit_(body_limit) {
    reset();
}

RequestParser::~RequestParser() = default;

void RequestParser::reset() {
    // basic_parser is single-shot, a fresh instance per message
    impl_ = std::make_unique<Impl>(listener_);
    impl_->header_limit(static_cast<std::uint32_t>(header_limit_));
    impl_->body_limit(body_limit_);
    impl_->eager(true);
}

beast::error_code RequestParser::feed(std::string_view data) {
    if (!data.empty()) {
        auto dest = buffer_.prepare(data.size());
        buffer_.commit(asio::buffer_copy(dest, asio::buffer(data.data(), data.size())));
    }
    return drive();
}

beast::error_code RequestParser::drive() {
    beast::error_code ec;
    while (buffer_.size() > 0 && !impl_->is_done()) {
        std::size_t used = impl_->put(buffer_.data(), ec);
        buffer_.consume(used);

        if (ec == http::error::need_more) {
            return {};
        }
        if (ec) {
            return ec;
        }
        if (used == 0) {
            break;
        }
    }
    return {};
}

bool RequestParser::message_done() const noexcept { return impl_->is_done(); }

bool RequestParser::keep_alive() const noexcept { return impl_->keep_alive(); }

unsigned int RequestParser::version() const noexcept { return impl_->version(); }

}  // namespace vireo::core

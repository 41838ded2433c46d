#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/beast.h — Boost.Beast request adapter
// ═══════════════════════════════════════════════════════════════════
//
//  bhttp::request<bhttp::string_body> req;
//  bhttp::read(socket, buffer, req);
//  auto form = formpp::fromBeast(req);
//  auto& title = form.forms().at("title").value();
//
// ═══════════════════════════════════════════════════════════════════

#include "request.h"
#include "stream.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <charconv>
#include <memory>
#include <string>

namespace formpp {

// Copies the body into an owned stream. The declared length is taken
// from Content-Length when present and well-formed, otherwise from the
// body size.
inline FormRequest fromBeast(
    const boost::beast::http::request<boost::beast::http::string_body>& req,
    multipart::Options options = {}) {
    namespace bhttp = boost::beast::http;

    auto ct = req[bhttp::field::content_type];
    std::string contentType(ct.data(), ct.size());

    const auto& body = req.body();
    std::size_t length = body.size();

    auto declared = req[bhttp::field::content_length];
    if (!declared.empty()) {
        std::size_t parsed = 0;
        auto [end, ec] = std::from_chars(declared.data(), declared.data() + declared.size(), parsed);
        if (ec == std::errc() && end == declared.data() + declared.size()) {
            length = parsed;
        }
    }

    return FormRequest(std::move(contentType), length,
                       std::make_unique<StringStream>(body), std::move(options));
}

} // namespace formpp

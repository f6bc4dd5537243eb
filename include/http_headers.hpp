#pragma once

#include <boost/beast/http.hpp>

namespace powgate {

template<class Body>
void add_security_headers(boost::beast::http::response<Body>& res) {
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Content-Security-Policy", "default-src 'none'");
}

// Browsers must be allowed to send the proof headers and read the issued ones.
template<class Body>
void add_cors_headers(boost::beast::http::response<Body>& res) {
    namespace http = boost::beast::http;
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers,
            "Content-Type, X-Nonce, X-Nonce-Checksum, X-Hash");
    res.set(http::field::access_control_expose_headers,
            "X-Nonce, X-Nonce-Checksum, X-Hash-Difficulty");
}

}

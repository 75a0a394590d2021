#include "rtvoice/backend/client.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace rtvoice {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = to_lower(working.substr(0, scheme_pos));
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        try {
            port = std::stoi(working.substr(port_pos + 1));
        } catch (const std::exception&) {
            throw BackendError("Invalid port in backend URL: " + url);
        }
    } else {
        host = working;
        port = scheme == "https" ? 443 : 80;
    }
}

}

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : authorization_token_(std::move(authorization_token)),
      options_(options) {
    parse_url(base_url, scheme_, host_, port_, base_path_);

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        client_https_->enable_server_certificate_verification(false);
#else
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    }
    apply_timeouts();
}

nlohmann::json BackendClient::get_json(const std::string& path) {
    const auto headers = make_headers(false);
    const auto full_path = build_path(path);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return parse_response(client_https_->Get(full_path.c_str(), headers));
    }
#endif
    return parse_response(client_http_->Get(full_path.c_str(), headers));
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto headers = make_headers(true);
    const auto full_path = build_path(path);
    const auto payload = body.dump();
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return parse_response(
            client_https_->Post(full_path.c_str(), headers, payload, "application/json"));
    }
#endif
    return parse_response(client_http_->Post(full_path.c_str(), headers, payload, "application/json"));
}

httplib::Headers BackendClient::make_headers(bool with_body) const {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (with_body) {
        headers.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

nlohmann::json BackendClient::parse_response(const httplib::Result& response) const {
    if (!response) {
        throw BackendError("Backend request failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 403) {
        throw BackendPermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("HTTP " + std::to_string(response->status) + ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError(std::string("Invalid JSON from backend: ") + ex.what());
    }
}

std::string BackendClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

void BackendClient::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        client_https_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_https_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_https_->set_write_timeout(options_.request_timeout.count(), 0);
        return;
    }
#endif
    if (client_http_) {
        client_http_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_http_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_http_->set_write_timeout(options_.request_timeout.count(), 0);
    }
}

}

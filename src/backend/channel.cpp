#include "rtvoice/backend/channel.hpp"

namespace rtvoice {

namespace {

std::string replace_scheme(const std::string& base_url) {
    if (base_url.rfind("https://", 0) == 0) {
        return "wss://" + base_url.substr(8);
    }
    if (base_url.rfind("http://", 0) == 0) {
        return "ws://" + base_url.substr(7);
    }
    if (base_url.rfind("ws://", 0) == 0 || base_url.rfind("wss://", 0) == 0) {
        return base_url;
    }
    return "ws://" + base_url;
}

}

std::string to_ws_url(const std::string& base_url, const std::string& path) {
    auto base = replace_scheme(base_url);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty()) {
        return base;
    }
    if (path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

}

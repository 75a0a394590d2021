#pragma once

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>

#include "rtvoice/config.hpp"
#include "spdlog/logger.h"

namespace rtvoice {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

namespace detail {

inline std::string render(const std::string& message, std::initializer_list<KeyValue> items) {
    if (items.size() == 0) {
        return message;
    }
    std::string result = message + " [";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            result += ", ";
        }
        first = false;
        result += item.key;
        result += '=';
        if (item.value.empty() || item.value.find(' ') != std::string::npos) {
            result += '"' + item.value + '"';
        } else {
            result += item.value;
        }
    }
    return result + "]";
}

}

void init(const Config& config);
void shutdown();
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, detail::render(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;

}

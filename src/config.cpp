#include "rtvoice/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "rtvoice/utils/text.hpp"

namespace rtvoice {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string normalize_path(std::string path) {
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return path;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::trim(line.substr(0, eq_pos));
        std::string value = utils::trim(line.substr(eq_pos + 1));
        if (key.empty() || std::getenv(key.c_str())) {
            continue;
        }
        set_env_value(key, strip_quotes(value));
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.backend_url = get_env_required("BACKEND_URL");
    while (!config.backend_url.empty() && config.backend_url.back() == '/') {
        config.backend_url.pop_back();
    }
    config.realtime_path = normalize_path(get_env_str("REALTIME_PATH", "/realtime"));
    config.relay_path = normalize_path(get_env_str("RELAY_PATH", "/relay"));
    config.call_path = normalize_path(get_env_str("CALL_PATH", "/api/call"));
    config.health_path = normalize_path(get_env_str("HEALTH_PATH", "/health"));

    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 30.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 30.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 30.0);

    config.interrupt_debounce_ms = get_env_int("INTERRUPT_DEBOUNCE_MS", 1000);
    config.playback_lookahead_ms = get_env_int("PLAYBACK_LOOKAHEAD_MS", 100);
    config.tool_removal_delay_ms = get_env_int("TOOL_REMOVAL_DELAY_MS", 2000);

    config.stream_sample_rate = get_env_int("STREAM_SAMPLE_RATE", 16000);
    config.audio_sample_rate = get_env_int("AUDIO_SAMPLE_RATE", 16000);
    config.frame_time_usec = get_env_int("FRAME_TIME_USEC", 20000);
    config.audio_null_device = get_env_bool("AUDIO_NULL_DEVICE", false);
    config.audio_log_level = get_env_int("AUDIO_LOG_LEVEL", 1);
    config.send_interrupt_on_stop = get_env_bool("SEND_INTERRUPT_ON_STOP", true);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    return config;
}

void Config::validate() const {
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (backend_url.rfind("http://", 0) != 0 && backend_url.rfind("https://", 0) != 0) {
        throw std::runtime_error("BACKEND_URL must start with http:// or https://");
    }
    if (interrupt_debounce_ms < 0) {
        throw std::runtime_error("INTERRUPT_DEBOUNCE_MS must be zero or positive");
    }
    if (playback_lookahead_ms < 0) {
        throw std::runtime_error("PLAYBACK_LOOKAHEAD_MS must be zero or positive");
    }
    if (tool_removal_delay_ms < 0) {
        throw std::runtime_error("TOOL_REMOVAL_DELAY_MS must be zero or positive");
    }
    if (stream_sample_rate <= 0) {
        throw std::runtime_error("STREAM_SAMPLE_RATE must be positive");
    }
    if (audio_sample_rate <= 0) {
        throw std::runtime_error("AUDIO_SAMPLE_RATE must be positive");
    }
    if (frame_time_usec <= 0) {
        throw std::runtime_error("FRAME_TIME_USEC must be positive");
    }
    if (backend_request_timeout <= 0.0 || backend_connect_timeout <= 0.0 ||
        backend_sock_read_timeout <= 0.0) {
        throw std::runtime_error("backend timeouts must be positive");
    }
}

}

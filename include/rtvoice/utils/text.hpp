#pragma once

#include <string>

namespace rtvoice::utils {

std::string trim(const std::string& text);
bool is_e164_number(const std::string& text);
std::string truncate_for_log(const std::string& text, size_t limit = 120);

}

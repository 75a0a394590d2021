#pragma once

#include <functional>

namespace rtvoice {
namespace utils {

void run_async(std::function<void()> task);

}
}

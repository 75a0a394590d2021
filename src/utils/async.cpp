#include "rtvoice/utils/async.hpp"

#include <exception>
#include <thread>

#include "rtvoice/logging.hpp"

namespace rtvoice::utils {

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Async task failed",
                {kv("error", ex.what())});
        }
    });
    worker.detach();
}

}

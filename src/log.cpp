#include <treedelta-cpp/log.hpp>

#include <mutex>

namespace treedelta_cpp {

auto logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(logger_name)) return existing;

    static auto create_mutex = std::mutex{};
    auto lock = std::lock_guard{create_mutex};
    if (auto existing = spdlog::get(logger_name)) return existing;
    auto created = spdlog::default_logger()->clone(logger_name);
    spdlog::register_logger(created);
    return created;
}

}  // namespace treedelta_cpp

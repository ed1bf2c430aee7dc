/// @file log.hpp
/// @brief The library's named spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace treedelta_cpp {

/// Name under which the library's logger is registered with spdlog.
inline constexpr auto logger_name = "treedelta";

/// The library logger.
///
/// Looked up by name on every call, so a logger the host registers as
/// "treedelta" is used from then on, even after the library has logged.
/// When none is registered the default logger is cloned under that name,
/// inheriting its sinks; a host replacing it later calls spdlog::drop
/// first. Sinks and levels are the host's business; the library only
/// emits.
auto logger() -> std::shared_ptr<spdlog::logger>;

}  // namespace treedelta_cpp

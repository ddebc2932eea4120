// Logging.hpp
// Library-wide logger configuration
#pragma once

#include <NGIN/Relations/Export.hpp>

#include <spdlog/spdlog.h>

#include <memory>

namespace NGIN::Relations
{

  using LoggerPtr = std::shared_ptr<spdlog::logger>;

  struct Options
  {
    // When empty the spdlog default logger is used.
    LoggerPtr logger;
  };

  /// Replace the active options. Not synchronized; call before using any host.
  NGIN_RELATIONS_API void Configure(const Options &options);

  [[nodiscard]] NGIN_RELATIONS_API const Options &GetOptions() noexcept;

  [[nodiscard]] NGIN_RELATIONS_API spdlog::logger &Logger();

} // namespace NGIN::Relations

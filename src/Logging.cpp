#include <NGIN/Relations/Logging.hpp>

namespace NGIN::Relations
{

  namespace
  {
    Options &ActiveOptions() noexcept
    {
      static Options s_options{};
      return s_options;
    }
  } // namespace

  void Configure(const Options &options)
  {
    ActiveOptions() = options;
  }

  const Options &GetOptions() noexcept
  {
    return ActiveOptions();
  }

  spdlog::logger &Logger()
  {
    auto &options = ActiveOptions();
    if (!options.logger)
      options.logger = spdlog::default_logger();
    return *options.logger;
  }

} // namespace NGIN::Relations

#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace strata::infrastructure::logging
{

class Logger_Spdlog final : public strata::application::ports::ILogger
{
 public:
  void init(const strata::domain::Settings& s) override;

  void app(strata::application::ports::LogLevel level, const std::string& msg) override;

  void decode(strata::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(strata::application::ports::LogLevel level);

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> decode_;

  // Helpers
  static spdlog::level::level_enum map_level(strata::application::ports::LogLevel l);
};

}  // namespace strata::infrastructure::logging

#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

namespace {

void Install(std::vector<spdlog::sink_ptr> &sinks) {
  if (s_Logger) {
    spdlog::drop(s_Logger->name());
  }
  s_Logger =
      std::make_shared<spdlog::logger>("EDGEABYSS", sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> MakeConsoleSink() {
  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  return consoleSink;
}

} // namespace

void Init() {
  std::vector<spdlog::sink_ptr> sinks;

  // Console sink with color
  sinks.push_back(MakeConsoleSink());

  // File sink
  auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "edgeabyss.log", true);
  fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
  sinks.push_back(fileSink);

  Install(sinks);
  LOG_INFO("Logging initialized");
}

void InitConsoleOnly() {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(MakeConsoleSink());
  Install(sinks);
}

void Shutdown() {
  s_Logger.reset();
  spdlog::shutdown();
}

void SetLevel(const spdlog::level::level_enum level) {
  GetLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  // Library code logs before the host calls Init() in some embeddings.
  if (!s_Logger) {
    InitConsoleOnly();
  }
  return s_Logger;
}

} // namespace Log

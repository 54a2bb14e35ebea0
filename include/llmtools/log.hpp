#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace llmtools {

/// Library logger ("llmtools"). Always writes to stderr: stdout carries the
/// protocol stream.
std::shared_ptr<spdlog::logger> logger();

/// Set the level of the library logger from a name such as "debug" or
/// "warn". Unknown names select "info" and return false.
bool set_log_level(std::string_view level);

} // namespace llmtools

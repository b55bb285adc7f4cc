#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

// shared stderr logger for the library, created on first use at warn level
std::shared_ptr<spdlog::logger> pagedseq_logger();

void set_log_level(const std::string& level_name);

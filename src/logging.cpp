#include <spdlog/sinks/stdout_color_sinks.h>

#include "../include/core.hpp"
#include "../include/logging.hpp"

std::shared_ptr<spdlog::logger> pagedseq_logger()
{
    static std::shared_ptr<spdlog::logger> logger = []()
    {
        auto existing = spdlog::get("pagedseq");
        if (existing)
        {
            return existing;
        }

        auto created = spdlog::stderr_color_mt("pagedseq");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return logger;
}

void set_log_level(const std::string& level_name)
{
    auto level = spdlog::level::from_str(level_name);

    // from_str maps unknown names to off
    if (level == spdlog::level::off && level_name != "off")
    {
        throw paged_sequence_exception("unknown log level: " + level_name);
    }
    pagedseq_logger()->set_level(level);
}

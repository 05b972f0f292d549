#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>


class Logger
{
public:
    /**
     * @brief Registers the core, provider and model loggers.
     *
     * Each logger writes to the console and to a rotating file under
     * <config dir>/logs. Throws spdlog::spdlog_ex when a sink cannot be created.
     */
    static void setup_loggers();

    /**
     * @brief Returns a registered logger by name, or nullptr when absent.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

private:
    static std::string get_log_file_path();
};

#endif // LOGGER_HPP

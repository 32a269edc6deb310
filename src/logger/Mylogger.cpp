#include "Mylogger.hpp"
#include <boost/log/trivial.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <iostream>

namespace logging = boost::log;

namespace
{
    logging::trivial::severity_level parse_level(const std::string &level)
    {
        if (level == "trace")
            return logging::trivial::trace;
        if (level == "debug")
            return logging::trivial::debug;
        if (level == "warning")
            return logging::trivial::warning;
        if (level == "error")
            return logging::trivial::error;
        if (level == "fatal")
            return logging::trivial::fatal;
        return logging::trivial::info;
    }
}

void MyLogger::init(const std::string &level, const std::string &log_file)
{
    logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");
    logging::add_console_log(
        std::clog,
        logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");
    if (!log_file.empty())
    {
        logging::add_file_log(
            logging::keywords::file_name = log_file,
            logging::keywords::auto_flush = true,
            logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");
    }
    logging::core::get()->set_filter(
        logging::trivial::severity >= parse_level(level));
    logging::add_common_attributes();
}

void MyLogger::debug(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(debug) << msg;
}

void MyLogger::info(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(info) << msg;
}

void MyLogger::warning(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(warning) << msg;
}

void MyLogger::error(const std::string &msg)
{
    BOOST_LOG_TRIVIAL(error) << msg;
}

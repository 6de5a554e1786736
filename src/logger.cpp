// =============================================================================
// logger.cpp - Boost.Log console setup
// =============================================================================

#include "nftamm/logger.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iomanip>
#include <iostream>
#include <string>

namespace nftamm {

void init_logger(LogLevel log_level) {
    boost::log::add_console_log
    (
        std::clog,
        boost::log::keywords::format = boost::log::expressions::stream <<
        "["   << boost::log::expressions::format_date_time< boost::posix_time::ptime >( "TimeStamp", "%Y-%m-%d %H:%M:%S.%f" ) <<
        "] [" << std::left << std::setw( 7 ) << std::setfill( ' ' ) << boost::log::trivial::severity <<
        "] "  << boost::log::expressions::smessage <<
        " ("  << boost::log::expressions::attr< std::string >( "File" ) <<
        ":"   << boost::log::expressions::attr< int >( "Line" ) <<
        ")",
        boost::log::keywords::filter = boost::log::trivial::severity >= log_level
    );

    boost::log::add_common_attributes();
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::trace;
    if (name == "debug") return LogLevel::debug;
    if (name == "info") return LogLevel::info;
    if (name == "warning" || name == "warn") return LogLevel::warning;
    if (name == "error") return LogLevel::error;
    if (name == "fatal") return LogLevel::fatal;
    return std::nullopt;
}

} // namespace nftamm

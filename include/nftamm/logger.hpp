#ifndef NFTAMM_LOGGER_HPP
#define NFTAMM_LOGGER_HPP

#include <boost/log/expressions.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <optional>
#include <string_view>

namespace nftamm {

using LogLevel = boost::log::trivial::severity_level;

// Severity, file, line and function are attached to every record
#define NFTAMM_LOG( sev ) \
    BOOST_LOG_STREAM_SEV( boost::log::trivial::logger::get( ), sev ) \
            << boost::log::add_value( "Line", __LINE__ ) \
            << boost::log::add_value( "File", __FILE__ ) \
            << boost::log::add_value( "Function", __FUNCTION__ )

#define NFTAMM_LOG_TRACE( ) NFTAMM_LOG( boost::log::trivial::severity_level::trace )
#define NFTAMM_LOG_DEBUG( ) NFTAMM_LOG( boost::log::trivial::severity_level::debug )
#define NFTAMM_LOG_INFO( ) NFTAMM_LOG( boost::log::trivial::severity_level::info )
#define NFTAMM_LOG_WARN( ) NFTAMM_LOG( boost::log::trivial::severity_level::warning )
#define NFTAMM_LOG_ERROR( ) NFTAMM_LOG( boost::log::trivial::severity_level::error )

// Console sink with timestamps; records below log_level are dropped
void init_logger(LogLevel log_level);

// "trace", "debug", "info", "warning"/"warn", "error", "fatal"
std::optional<LogLevel> parse_log_level(std::string_view name);

} // namespace nftamm

#endif // NFTAMM_LOGGER_HPP

#include "pipeline_config.h"
#include "wpd_errors.h"

#include "crow/json.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{
    // repeated keys
    constexpr char kBounds[]            =   "bounds";
    constexpr char kForecastHours[]     =   "forecast_hours";

    double readNumber( const crow :: json :: rvalue& node, const char* key, double fallback )
    {
        if( !node.has( key ) )
            return fallback;

        if( node[ key ].t() != crow :: json :: type :: Number )
            throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + key );

        return node[ key ].d();
    }

    int readInt( const crow :: json :: rvalue& node, const char* key, int fallback )
    {
        if( !node.has( key ) )
            return fallback;

        if( node[ key ].t() != crow :: json :: type :: Number )
            throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + key );

        return static_cast<int>( node[ key ].i() );
    }

    std :: string readString( const crow :: json :: rvalue& node, const char* key, const std :: string& fallback )
    {
        if( !node.has( key ) )
            return fallback;

        if( node[ key ].t() != crow :: json :: type :: String )
            throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + key );

        return std :: string( node[ key ].s() );
    }

    void ensureDirectory( const std :: filesystem :: path& dir )
    {
        if( dir.empty() )
            return;

        std :: error_code ec;
        std :: filesystem :: create_directories( dir, ec );
        if( ec )
            throw StaleConfiguration( Errors :: FAIL_MKDIR + dir.string() + " (" + ec.message() + ")" );
    }
}

PipelineConfig loadPipelineConfig( const std :: string& path )
{
    PipelineConfig config;

    std :: ifstream file( path );
    if( !file )
    {
        CROW_LOG_INFO << "No configuration file at " << path << ", using defaults";
        return config;
    }

    std :: ostringstream buffer;
    buffer << file.rdbuf();

    auto doc = crow :: json :: load( buffer.str() );
    if( !doc || doc.t() != crow :: json :: type :: Object )
        throw StaleConfiguration( Errors :: FAIL_R_CONFIG + path );

    config.databasePath     =   readString( doc, "database_path", config.databasePath );
    config.rawDataDir       =   readString( doc, "raw_data_dir", config.rawDataDir );
    config.plotsDir         =   readString( doc, "plots_dir", config.plotsDir );
    config.boundariesPath   =   readString( doc, "boundaries_path", config.boundariesPath );
    config.continent        =   readString( doc, "continent", config.continent );
    config.airDensity       =   readNumber( doc, "air_density", config.airDensity );

    if( doc.has( kBounds ) )
    {
        const auto& bounds      =   doc[ kBounds ];
        config.bounds.latMin    =   readNumber( bounds, "lat_min", config.bounds.latMin );
        config.bounds.latMax    =   readNumber( bounds, "lat_max", config.bounds.latMax );
        config.bounds.lonMin    =   readNumber( bounds, "lon_min", config.bounds.lonMin );
        config.bounds.lonMax    =   readNumber( bounds, "lon_max", config.bounds.lonMax );

        if( config.bounds.latMin >= config.bounds.latMax || config.bounds.lonMin >= config.bounds.lonMax )
            throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + kBounds );
    }

    if( doc.has( kForecastHours ) )
    {
        const auto& hours               =   doc[ kForecastHours ];
        config.forecastHours.start      =   readInt( hours, "start", config.forecastHours.start );
        config.forecastHours.end        =   readInt( hours, "end", config.forecastHours.end );
        config.forecastHours.step       =   readInt( hours, "step", config.forecastHours.step );

        if( config.forecastHours.start < 0 || config.forecastHours.step <= 0 ||
            config.forecastHours.end < config.forecastHours.start )
            throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + kForecastHours );
    }

    config.schedulerIntervalHours = readInt( doc, "scheduler_interval_hours", config.schedulerIntervalHours );
    if( config.schedulerIntervalHours <= 0 )
        throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + std :: string( "scheduler_interval_hours" ) );

    int port = readInt( doc, "server_port", static_cast<int>( config.serverPort ) );
    if( port <= 0 || port > 65535 )
        throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + std :: string( "server_port" ) );
    config.serverPort = static_cast<unsigned int>( port );

    if( doc.has( "log_level" ) )
        config.logLevel = parseLogLevel( readString( doc, "log_level", "info" ) );

    if( config.airDensity <= 0.0 )
        throw StaleConfiguration( Errors :: BAD_CONFIG_KEY + std :: string( "air_density" ) );

    return config;
}

std :: vector<int> forecastHours( const ForecastHourRange& range )
{
    std :: vector<int> hours;
    for( int hour = range.start; hour <= range.end; hour += range.step )
    {
        hours.push_back( hour );
    }
    return hours;
}

crow :: LogLevel parseLogLevel( const std :: string& name )
{
    if( name == "debug" )       return crow :: LogLevel :: Debug;
    if( name == "info" )        return crow :: LogLevel :: Info;
    if( name == "warning" )     return crow :: LogLevel :: Warning;
    if( name == "error" )       return crow :: LogLevel :: Error;
    if( name == "critical" )    return crow :: LogLevel :: Critical;

    throw StaleConfiguration( Errors :: BAD_LOG_LEVEL + name );
}

void setupWorkspace( const PipelineConfig& config )
{
    crow :: logger :: setLogLevel( config.logLevel );

    ensureDirectory( std :: filesystem :: path( config.databasePath ).parent_path() );
    ensureDirectory( config.rawDataDir );
    ensureDirectory( config.plotsDir );

    CROW_LOG_DEBUG << "Workspace ready: db=" << config.databasePath
                   << " raw=" << config.rawDataDir
                   << " plots=" << config.plotsDir;
}

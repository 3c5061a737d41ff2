#include "command_line.h"
#include "wpd_errors.h"

CommandLine parseCommandLine( int argc, const char* const argv[] )
{
    CommandLine commandLine;

    if( argc < 2 )
        throw StaleConfiguration( "missing mode" );

    commandLine.mode = argv[ 1 ];

    for( int i = 2; i < argc; i += 2 )
    {
        std :: string key( argv[ i ] );
        if( key.rfind( "--", 0 ) != 0 || i + 1 >= argc )
            throw StaleConfiguration( "bad option: " + key );

        commandLine.options[ key.substr( 2 ) ] = argv[ i + 1 ];
    }
    return commandLine;
}

std :: string option( const CommandLine& commandLine, const std :: string& key, const std :: string& fallback )
{
    auto it = commandLine.options.find( key );
    return it == commandLine.options.end() ? fallback : it->second;
}

void requireOnly( const CommandLine& commandLine, std :: initializer_list<const char*> allowed )
{
    for( const auto& entry : commandLine.options )
    {
        bool known = entry.first == "config";
        for( const char* key : allowed )
            known = known || entry.first == key;

        if( !known )
            throw StaleConfiguration( "option --" + entry.first + " not valid for mode " + commandLine.mode );
    }
}

ForecastCycle manualTarget( const CommandLine& commandLine, std :: time_t now )
{
    requireOnly( commandLine, { "date", "cycle" } );

    ForecastCycle target = parseForecastCycle( option( commandLine, "date" ), option( commandLine, "cycle" ) );
    requireAvailableDate( target.date, now );
    return target;
}

#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#include "forecast_cycle.h"

#include <ctime>
#include <initializer_list>
#include <map>
#include <string>

struct CommandLine
{
    std :: string                               mode;
    std :: map<std :: string, std :: string>    options;
};

// mode first, then --key value pairs; throws StaleConfiguration
CommandLine     parseCommandLine( int argc, const char* const argv[] );

std :: string   option          ( const CommandLine& commandLine,
                                  const std :: string& key,
                                  const std :: string& fallback = "" );

// --config is always allowed
void            requireOnly     ( const CommandLine& commandLine, std :: initializer_list<const char*> allowed );

/*!
    The cycle `manual --date --cycle` asks for, checked before anything
    touches the workspace: only --date and --cycle, both well formed, date
    not after the UTC day of now. Throws StaleConfiguration.
*/
ForecastCycle   manualTarget    ( const CommandLine& commandLine, std :: time_t now );

#endif

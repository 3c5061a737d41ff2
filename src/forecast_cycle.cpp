#include "forecast_cycle.h"
#include "wpd_errors.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace
{
    bool isLeap( int year )
    {
        return ( year % 4 == 0 && year % 100 != 0 ) || ( year % 400 == 0 );
    }

    int daysInMonth( int year, int month )
    {
        static const int days[ 12 ] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
        if( month == 2 )
            return days[ 1 ] + ( isLeap( year ) ? 1 : 0 );
        return days[ month - 1 ];
    }

    // midnight UTC of a validated YYYYMMDD string
    std :: time_t midnightUtc( const std :: string& date )
    {
        std :: tm tm {};
        tm.tm_year  =   std :: stoi( date.substr( 0, 4 ) ) - 1900;
        tm.tm_mon   =   std :: stoi( date.substr( 4, 2 ) ) - 1;
        tm.tm_mday  =   std :: stoi( date.substr( 6, 2 ) );
        return timegm( &tm );
    }
}

bool isValidCycle( const std :: string& cycle )
{
    return std :: any_of( kCycles.begin(), kCycles.end(),
                          [ &cycle ]( const char* known ) { return cycle == known; } );
}

bool isValidDate( const std :: string& date )
{
    if( date.size() != 8 )
        return false;

    for( char c : date )
    {
        if( !std :: isdigit( static_cast<unsigned char>( c ) ) )
            return false;
    }

    int year    =   std :: stoi( date.substr( 0, 4 ) );
    int month   =   std :: stoi( date.substr( 4, 2 ) );
    int day     =   std :: stoi( date.substr( 6, 2 ) );

    if( year < 1900 || month < 1 || month > 12 )
        return false;

    return day >= 1 && day <= daysInMonth( year, month );
}

ForecastCycle parseForecastCycle( const std :: string& date, const std :: string& cycle )
{
    if( !isValidCycle( cycle ) )
        throw StaleConfiguration( Errors :: INVALID_CYCLE + cycle );

    if( !isValidDate( date ) )
        throw StaleConfiguration( Errors :: INVALID_DATE + date );

    return ForecastCycle { date, cycle };
}

void requireAvailableDate( const std :: string& date, std :: time_t now )
{
    // YYYYMMDD strings order the same way the dates do
    if( date > utcDate( now ) )
        throw StaleConfiguration( Errors :: FUTURE_DATE + date );
}

std :: string forecastDay( const std :: string& date, int forecastHour )
{
    return utcDate( midnightUtc( date ) + static_cast<std :: time_t>( forecastHour ) * 3600 );
}

std :: string utcDate( std :: time_t when )
{
    std :: tm tm {};
    gmtime_r( &when, &tm );

    char buffer[ 9 ] = { 0 };
    std :: snprintf( buffer, sizeof( buffer ), "%04d%02d%02d",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday );
    return std :: string( buffer );
}

ForecastCycle targetCycleFor( std :: time_t now )
{
    std :: tm tm {};
    gmtime_r( &now, &tm );

    if( tm.tm_hour < 6 )
        return ForecastCycle { utcDate( now - 24 * 3600 ), "18" };
    if( tm.tm_hour < 12 )
        return ForecastCycle { utcDate( now ), "00" };
    if( tm.tm_hour < 18 )
        return ForecastCycle { utcDate( now ), "06" };

    return ForecastCycle { utcDate( now ), "12" };
}

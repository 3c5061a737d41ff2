#ifndef FORECAST_CYCLE_H
#define FORECAST_CYCLE_H

#include <array>
#include <ctime>
#include <string>

// the four synoptic issuance times, in issuance order
constexpr std :: array<const char*, 4> kCycles  =   { "00", "06", "12", "18" };

/*!
    One forecast run: calendar date in YYYYMMDD form plus synoptic cycle.
    Never stored on its own; it is the key every stage and query works on.
*/
struct ForecastCycle
{
    std :: string   date;
    std :: string   cycle;

    bool operator==( const ForecastCycle& other ) const
    {
        return date == other.date && cycle == other.cycle;
    }

    std :: string label() const
    {
        return date + "_" + cycle;
    }
};

bool            isValidCycle        ( const std :: string& cycle );
bool            isValidDate         ( const std :: string& date );

// validate both parts, throws StaleConfiguration
ForecastCycle   parseForecastCycle  ( const std :: string& date, const std :: string& cycle );

// throws StaleConfiguration when the date lies after the UTC day of now
void            requireAvailableDate( const std :: string& date, std :: time_t now );

// UTC calendar day of ( date 00Z + hours ), as YYYYMMDD
std :: string   forecastDay         ( const std :: string& date, int forecastHour );

// UTC calendar day of a timestamp, as YYYYMMDD
std :: string   utcDate             ( std :: time_t when );

/*!
    Latest cycle the upstream source normally has published by `now`:
    00-05 -> previous day 18, 06-11 -> 00, 12-17 -> 06, 18-23 -> 12.
*/
ForecastCycle   targetCycleFor      ( std :: time_t now );

#endif

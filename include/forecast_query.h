#ifndef FORECAST_QUERY_H
#define FORECAST_QUERY_H

#include "forecast_store.h"

#include <optional>
#include <string>
#include <vector>

struct HourlyAverage
{
    int                         forecastHour    =   0;
    std :: optional<double>     avgWindPowerDensity;
};

/*!
    Read-only view of the store for the viewer. Nothing here is cached or
    stored: every call is a fresh read, and derived views such as the hourly
    average are recomputed from the rows each time.
*/
class ForecastQuery
{
    public:
        explicit ForecastQuery( const ForecastStore& store );

        // newest first
        std :: vector<std :: string>    listDates       () const;
        std :: vector<std :: string>    listCycles      ( const std :: string& date ) const;

        std :: vector<ForecastSample>   getSamples      ( const std :: string& date, const std :: string& cycle ) const;
        std :: vector<ForecastSample>   getSamples      ( const std :: string& date, const std :: string& cycle,
                                                          int forecastHour ) const;

        // ordered by rank
        std :: vector<CountryRanking>   getRanking      ( const std :: string& date, const std :: string& cycle ) const;

        std :: vector<HourlyAverage>    hourlyAverage   ( const std :: string& date, const std :: string& cycle ) const;

        // group by forecast hour, mean of non-null values, ascending hour
        static std :: vector<HourlyAverage> hourlyAverage( const std :: vector<ForecastSample>& samples );

    private:
        const ForecastStore&    store_;
};

#endif

#include "forecast_query.h"
#include "raster_snapshot.h"
#include "wpd_errors.h"

ForecastQuery :: ForecastQuery( const ForecastStore& store ) : store_( store )
{
}

std :: vector<std :: string> ForecastQuery :: listDates() const
{
    return store_.listDates();
}

std :: vector<std :: string> ForecastQuery :: listCycles( const std :: string& date ) const
{
    if( !isValidDate( date ) )
        throw StaleConfiguration( Errors :: INVALID_DATE + date );

    return store_.listCycles( date );
}

std :: vector<ForecastSample> ForecastQuery :: getSamples( const std :: string& date, const std :: string& cycle ) const
{
    return store_.loadSamples( parseForecastCycle( date, cycle ) );
}

std :: vector<ForecastSample> ForecastQuery :: getSamples( const std :: string& date, const std :: string& cycle,
                                                           int forecastHour ) const
{
    return store_.loadSamples( parseForecastCycle( date, cycle ), forecastHour );
}

std :: vector<CountryRanking> ForecastQuery :: getRanking( const std :: string& date, const std :: string& cycle ) const
{
    return store_.loadRankings( parseForecastCycle( date, cycle ) );
}

std :: vector<HourlyAverage> ForecastQuery :: hourlyAverage( const std :: string& date, const std :: string& cycle ) const
{
    return hourlyAverage( getSamples( date, cycle ) );
}

std :: vector<HourlyAverage> ForecastQuery :: hourlyAverage( const std :: vector<ForecastSample>& samples )
{
    auto groups = groupMeans<int>( samples, []( const ForecastSample& s ) { return s.forecastHour; } );

    std :: vector<HourlyAverage> series;
    series.reserve( groups.size() );

    for( const auto& group : groups )
    {
        series.push_back( HourlyAverage { group.first, group.second.mean() } );
    }
    return series;
}

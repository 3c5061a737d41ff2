#include "raster_snapshot.h"
#include "forecast_cycle.h"

#include <algorithm>
#include <set>

namespace
{
    using CellKey = std :: pair<double, double>;  // ( lat, lon )

    // smallest spacing between neighbouring coordinates
    double resolution( const std :: vector<double>& axis )
    {
        if( axis.size() < 2 )
            return kDefaultGridResolution;

        double step = std :: numeric_limits<double> :: max();
        for( std :: size_t i = 1; i < axis.size(); i++ )
        {
            step = std :: min( step, axis[ i ] - axis[ i - 1 ] );
        }
        return step;
    }

    std :: size_t indexOf( const std :: vector<double>& axis, double coordinate )
    {
        return static_cast<std :: size_t>( std :: lower_bound( axis.begin(), axis.end(), coordinate ) - axis.begin() );
    }
}

RasterSnapshot :: RasterSnapshot( std :: vector<double> lats, std :: vector<double> lons ) : lats_( std :: move( lats ) ),
                                                                                          lons_( std :: move( lons ) )
{
    std :: sort( lats_.begin(), lats_.end() );
    std :: sort( lons_.begin(), lons_.end() );
    values_.assign( lats_.size() * lons_.size(), std :: numeric_limits<double> :: quiet_NaN() );
}

RasterSnapshot RasterSnapshot :: fromSamples( const std :: vector<ForecastSample>& samples )
{
    auto cells = groupMeans<CellKey>( samples, []( const ForecastSample& s ) { return CellKey( s.lat, s.lon ); } );
    return fromCellMeans( cells );
}

std :: map<std :: string, RasterSnapshot> RasterSnapshot :: dailyFromSamples( const std :: vector<ForecastSample>& samples,
                                                                              const std :: string& runDate )
{
    // bucket rows by forecast day first, the lattice is built per bucket
    std :: map<std :: string, std :: vector<ForecastSample>> byDay;
    for( const auto& sample : samples )
    {
        byDay[ forecastDay( runDate, sample.forecastHour ) ].push_back( sample );
    }

    std :: map<std :: string, RasterSnapshot> rasters;
    for( const auto& day : byDay )
    {
        rasters.emplace( day.first, fromSamples( day.second ) );
    }
    return rasters;
}

RasterSnapshot RasterSnapshot :: fromCellMeans( const std :: map<CellKey, MeanAccumulator>& cells )
{
    std :: set<double> latSet;
    std :: set<double> lonSet;
    for( const auto& cell : cells )
    {
        latSet.insert( cell.first.first );
        lonSet.insert( cell.first.second );
    }

    RasterSnapshot raster( std :: vector<double>( latSet.begin(), latSet.end() ),
                           std :: vector<double>( lonSet.begin(), lonSet.end() ) );

    for( const auto& cell : cells )
    {
        auto mean = cell.second.mean();
        if( !mean )
            continue;

        raster.setValue( indexOf( raster.lats_, cell.first.first ),
                         indexOf( raster.lons_, cell.first.second ),
                         *mean );
    }
    return raster;
}

double RasterSnapshot :: value( std :: size_t row, std :: size_t col ) const
{
    return values_.at( row * lons_.size() + col );
}

bool RasterSnapshot :: isDefined( std :: size_t row, std :: size_t col ) const
{
    return !std :: isnan( value( row, col ) );
}

void RasterSnapshot :: setValue( std :: size_t row, std :: size_t col, double value )
{
    values_.at( row * lons_.size() + col ) = value;
}

std :: size_t RasterSnapshot :: definedCellCount() const
{
    return static_cast<std :: size_t>( std :: count_if( values_.begin(), values_.end(),
                                                        []( double v ) { return !std :: isnan( v ); } ) );
}

double RasterSnapshot :: minValue() const
{
    double result = std :: numeric_limits<double> :: quiet_NaN();
    for( double v : values_ )
    {
        if( !std :: isnan( v ) && ( std :: isnan( result ) || v < result ) )
            result = v;
    }
    return result;
}

double RasterSnapshot :: maxValue() const
{
    double result = std :: numeric_limits<double> :: quiet_NaN();
    for( double v : values_ )
    {
        if( !std :: isnan( v ) && ( std :: isnan( result ) || v > result ) )
            result = v;
    }
    return result;
}

double RasterSnapshot :: latResolution() const
{
    return resolution( lats_ );
}

double RasterSnapshot :: lonResolution() const
{
    return resolution( lons_ );
}

std :: vector<std :: vector<double>> RasterSnapshot :: toGrid() const
{
    std :: vector<std :: vector<double>> grid( rows(), std :: vector<double>( cols() ) );

    for( std :: size_t i = 0; i < rows(); i++ )
    {
        for( std :: size_t j = 0; j < cols(); j++ )
        {
            grid[ i ][ j ] = value( i, j );
        }
    }
    return grid;
}

#include "grid_source.h"
#include "wpd_errors.h"

#include "crow/logging.h"

#include <ncDim.h>
#include <ncException.h>
#include <ncFile.h>
#include <ncVar.h>
#include <ncVarAtt.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <initializer_list>
#include <limits>

using namespace netCDF;

namespace
{
    // variable names in the raw grid file
    constexpr char kLat[]           =   "lat";
    constexpr char kLon[]           =   "lon";
    constexpr char kForecastHour[]  =   "forecast_hour";
    constexpr char kU100[]          =   "u100";
    constexpr char kV100[]          =   "v100";

    // inclusive index window of a monotonic axis that falls inside [ lo, hi ]
    struct IndexWindow
    {
        std :: size_t   first   =   0;
        std :: size_t   count   =   0;
    };

    NcVar requireVar( const NcFile& dataFile, const char* name )
    {
        NcVar var = dataFile.getVar( name );
        if( var.isNull() )
            throw SourceUnavailable( Errors :: MISSING_VAR + name );
        return var;
    }

    std :: vector<double> readAxis( const NcVar& var )
    {
        std :: vector<double> values( var.getDim( 0 ).getSize() );
        var.getVar( values.data() );
        return values;
    }

    IndexWindow windowInside( const std :: vector<double>& axis, double lo, double hi )
    {
        IndexWindow window;
        bool found = false;

        for( std :: size_t i = 0; i < axis.size(); i++ )
        {
            if( axis[ i ] < lo || axis[ i ] > hi )
                continue;

            if( !found )
            {
                window.first = i;
                found = true;
            }
            window.count = i - window.first + 1;
        }
        return window;
    }

    // fill and missing values read as NaN
    void maskFillValues( const NcVar& var, std :: vector<double>& values )
    {
        auto attributes = var.getAtts();

        for( const char* name : { "_FillValue", "missing_value" } )
        {
            auto found = attributes.find( name );
            if( found == attributes.end() )
                continue;

            double fill;
            found->second.getValues( &fill );
            std :: replace( values.begin(), values.end(), fill, std :: numeric_limits<double> :: quiet_NaN() );
        }
    }

    std :: vector<double> readSlice( const NcVar& var, std :: size_t timeIndex,
                                     const IndexWindow& latWindow, const IndexWindow& lonWindow )
    {
        std :: vector<double> values( latWindow.count * lonWindow.count );

        var.getVar
        (
            {
                timeIndex, latWindow.first, lonWindow.first
            },
            {
                1, latWindow.count, lonWindow.count
            },
            values.data()
        );

        maskFillValues( var, values );
        return values;
    }
}

NetCDFGridSource :: NetCDFGridSource( const std :: string& rawDataDir,
                                      const GeoBounds& bounds,
                                      const std :: vector<int>& forecastHours ) : rawDataDir_( rawDataDir ),
                                                                                  bounds_( bounds ),
                                                                                  forecastHours_( forecastHours )
{
}

std :: string NetCDFGridSource :: pathFor( const ForecastCycle& cycle ) const
{
    return ( std :: filesystem :: path( rawDataDir_ ) / ( "gfs_" + cycle.date + "_" + cycle.cycle + ".nc" ) ).string();
}

/*!
    Read every configured forecast hour of the cycle's file. A file that is
    absent or unreadable is SourceUnavailable; a single hour that fails to
    decode is skipped with a warning so the rest of the cycle still lands.
*/
std :: vector<GridFrame> NetCDFGridSource :: fetchGrid( const ForecastCycle& cycle )
{
    const std :: string path = pathFor( cycle );

    if( !std :: filesystem :: exists( path ) )
        throw SourceUnavailable( Errors :: MISSING_GRID + cycle.label() + " (" + path + ")" );

    std :: vector<GridFrame> frames;

    try
    {
        NcFile dataFile( path, NcFile :: read );

        auto lats = readAxis( requireVar( dataFile, kLat ) );
        auto lons = readAxis( requireVar( dataFile, kLon ) );

        NcVar hourVar = requireVar( dataFile, kForecastHour );
        std :: vector<int> hours( hourVar.getDim( 0 ).getSize() );
        hourVar.getVar( hours.data() );

        NcVar u = requireVar( dataFile, kU100 );
        NcVar v = requireVar( dataFile, kV100 );

        auto latWindow = windowInside( lats, bounds_.latMin, bounds_.latMax );
        auto lonWindow = windowInside( lons, bounds_.lonMin, bounds_.lonMax );

        if( latWindow.count == 0 || lonWindow.count == 0 )
            throw SourceUnavailable( Errors :: EMPTY_SUBSET + path );

        for( std :: size_t t = 0; t < hours.size(); t++ )
        {
            if( std :: find( forecastHours_.begin(), forecastHours_.end(), hours[ t ] ) == forecastHours_.end() )
                continue;

            try
            {
                GridFrame frame;
                frame.forecastHour  =   hours[ t ];
                frame.lats.assign( lats.begin() + latWindow.first, lats.begin() + latWindow.first + latWindow.count );
                frame.lons.assign( lons.begin() + lonWindow.first, lons.begin() + lonWindow.first + lonWindow.count );
                frame.u             =   readSlice( u, t, latWindow, lonWindow );
                frame.v             =   readSlice( v, t, latWindow, lonWindow );

                frames.push_back( std :: move( frame ) );
            }
            catch( const exceptions :: NcException& e )
            {
                CROW_LOG_WARNING << "Could not read forecast hour " << hours[ t ]
                                 << " of " << cycle.label() << ": " << e.what();
            }
        }
    }
    catch( const exceptions :: NcException& e )
    {
        throw SourceUnavailable( Errors :: FAIL_R_GRID + path + ": " + e.what() );
    }

    CROW_LOG_INFO << "Read " << frames.size() << " forecast hours from " << path;
    return frames;
}

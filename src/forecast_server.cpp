#include "forecast_server.h"
#include "raster_snapshot.h"
#include "wpd_errors.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>

// TO-DO: stream /samples for full cycles instead of building one JSON body

namespace
{
    JSONValue sampleToJSON( const ForecastSample& sample )
    {
        JSONValue row;
        row[ "lat" ]            =   sample.lat;
        row[ "lon" ]            =   sample.lon;
        row[ "forecast_hour" ]  =   sample.forecastHour;

        if( sample.windPowerDensity )
            row[ "wind_power_density" ] = *sample.windPowerDensity;
        else
            row[ "wind_power_density" ] = nullptr;

        return row;
    }

    JSONValue rankingToJSON( const CountryRanking& ranking )
    {
        JSONValue row;
        row[ "country" ]                =   ranking.country;
        row[ "avg_wind_power_density" ] =   ranking.avgWindPowerDensity;
        row[ "rank" ]                   =   ranking.rank;
        return row;
    }

    JSONList stringsToJSON( const std :: vector<std :: string>& values )
    {
        JSONList list;
        for( const auto& value : values )
        {
            list.push_back( value );
        }
        return list;
    }
}

ForecastServer :: ForecastServer( const PipelineConfig& config,
                                  MapRenderer& renderer,
                                  PolygonSource& polygons ) : databasePath_( config.databasePath ),
                                                              assetsPath_( ( std :: filesystem :: path( config.plotsDir ) / "tmp_" ).string() ),
                                                              renderer_( renderer ),
                                                              polygons_( polygons ),
                                                              boundariesCached_( false )
{
}

void ForecastServer :: run( unsigned int port )
{
    CROW_ROUTE( app_, "/dates" )
    ( [ this ]( const Request& request )
    {
        auto query      { request.raw_url };

        if( query.find( '?' ) != std :: string :: npos )
        {
            JSONValue result;
            result[ kError ] = ServerErrors :: INVALID_PARM + "/dates takes no parameters.";
            return JSONResponse( std :: move( result ), 400 );
        }

        return handleGetDates();
    } );

    CROW_ROUTE( app_, "/cycles" )
    ( [ this ]( const Request& request )
    {
        return handleGetCycles( request );
    } );

    CROW_ROUTE( app_, "/samples" )
    ( [ this ]( const Request& request )
    {
        return handleGetSamples( request );
    } );

    CROW_ROUTE( app_, "/rankings" )
    ( [ this ]( const Request& request )
    {
        return handleGetRankings( request );
    } );

    CROW_ROUTE( app_, "/hourly-average" )
    ( [ this ]( const Request& request )
    {
        return handleGetHourlyAverage( request );
    } );

    CROW_ROUTE( app_, "/map" )
    ( [ this ]( const Request& request )
    {
        return handleGetMap( request );
    } );

    CROW_LOG_INFO << "Serving " << databasePath_ << " on port " << port;

    try
    {
        app_.bindaddr( "0.0.0.0" ).port( static_cast<std :: uint16_t>( port ) ).multithreaded().run();
    }
    catch( const std :: exception& e )
    {
        throw PipelineError( ServerErrors :: FAIL_START + e.what() );
    }
}


/*!
    Open a read-only session for this request and hand it to the handler.
    Bad input maps to 400, a store failure to 500, both as a JSON error.
*/
template <typename Handler>
Response ForecastServer :: withQuery( Handler handler )
{
    JSONValue result;

    try
    {
        ForecastStore store( databasePath_, ForecastStore :: Mode :: ReadOnly );
        ForecastQuery query( store );
        return handler( query );
    }
    catch( const StaleConfiguration& e )
    {
        result[ kError ] = e.what();
        return JSONResponse( std :: move( result ), 400 );
    }
    catch( const std :: exception& e )
    {
        CROW_LOG_ERROR << e.what();
        result[ kError ] = e.what();
        return JSONResponse( std :: move( result ), 500 );
    }
}


/*+++++++++++++++++*
|  handleGetDates  |
*++++++++++++++++++*/

Response ForecastServer :: handleGetDates()
{
    return withQuery( [ this ]( const ForecastQuery& query )
    {
        JSONValue result;
        result[ "dates" ] = stringsToJSON( query.listDates() );
        return JSONResponse( std :: move( result ) );
    } );
}


/*++++++++++++++++++*
|  handleGetCycles  |
*+++++++++++++++++++*/

Response ForecastServer :: handleGetCycles( const Request& request )
{
    JSONValue           result;
    RequestParameters   parameters;

    if( !validateRequestParameters( request, { kDate }, {}, result, parameters ) )
        return JSONResponse( std :: move( result ), 400 );

    return withQuery( [ this, &parameters ]( const ForecastQuery& query )
    {
        JSONValue body;
        body[ kDate ]       =   parameters.date;
        body[ "cycles" ]    =   stringsToJSON( query.listCycles( parameters.date ) );
        return JSONResponse( std :: move( body ) );
    } );
}


/*+++++++++++++++++++*
|  handleGetSamples  |
*++++++++++++++++++++*/

/*!
    /samples?date=YYYYMMDD&cycle=CC[&hour=H] - stored samples of a cycle,
    optionally one forecast hour only. Null densities stay null in the JSON.
*/
Response ForecastServer :: handleGetSamples( const Request& request )
{
    JSONValue           result;
    RequestParameters   parameters;

    if( !validateRequestParameters( request, { kDate, kCycle }, { kHour }, result, parameters ) )
        return JSONResponse( std :: move( result ), 400 );

    return withQuery( [ this, &parameters ]( const ForecastQuery& query )
    {
        auto samples = parameters.hasHour
                       ? query.getSamples( parameters.date, parameters.cycle, parameters.hour )
                       : query.getSamples( parameters.date, parameters.cycle );

        JSONList rows;
        for( const auto& sample : samples )
        {
            rows.push_back( sampleToJSON( sample ) );
        }

        JSONValue body;
        body[ kDate ]       =   parameters.date;
        body[ kCycle ]      =   parameters.cycle;
        body[ "samples" ]   =   std :: move( rows );
        return JSONResponse( std :: move( body ) );
    } );
}


/*++++++++++++++++++++*
|  handleGetRankings  |
*+++++++++++++++++++++*/

Response ForecastServer :: handleGetRankings( const Request& request )
{
    JSONValue           result;
    RequestParameters   parameters;

    if( !validateRequestParameters( request, { kDate, kCycle }, {}, result, parameters ) )
        return JSONResponse( std :: move( result ), 400 );

    return withQuery( [ this, &parameters ]( const ForecastQuery& query )
    {
        JSONList rows;
        for( const auto& ranking : query.getRanking( parameters.date, parameters.cycle ) )
        {
            rows.push_back( rankingToJSON( ranking ) );
        }

        JSONValue body;
        body[ kDate ]       =   parameters.date;
        body[ kCycle ]      =   parameters.cycle;
        body[ "rankings" ]  =   std :: move( rows );
        return JSONResponse( std :: move( body ) );
    } );
}


/*+++++++++++++++++++++++++*
|  handleGetHourlyAverage  |
*++++++++++++++++++++++++++*/

Response ForecastServer :: handleGetHourlyAverage( const Request& request )
{
    JSONValue           result;
    RequestParameters   parameters;

    if( !validateRequestParameters( request, { kDate, kCycle }, {}, result, parameters ) )
        return JSONResponse( std :: move( result ), 400 );

    return withQuery( [ this, &parameters ]( const ForecastQuery& query )
    {
        JSONList series;
        for( const auto& point : query.hourlyAverage( parameters.date, parameters.cycle ) )
        {
            JSONValue row;
            row[ "forecast_hour" ] = point.forecastHour;

            if( point.avgWindPowerDensity )
                row[ "avg_wind_power_density" ] = *point.avgWindPowerDensity;
            else
                row[ "avg_wind_power_density" ] = nullptr;

            series.push_back( std :: move( row ) );
        }

        JSONValue body;
        body[ kDate ]           =   parameters.date;
        body[ kCycle ]          =   parameters.cycle;
        body[ "hourly_average" ] =  std :: move( series );
        return JSONResponse( std :: move( body ) );
    } );
}


/*+++++++++++++++*
|  handleGetMap  |
*++++++++++++++++*/

/*!
    /map?date=YYYYMMDD&cycle=CC&hour=H - png of the raster of one forecast
    hour with country outlines.
*/
Response ForecastServer :: handleGetMap( const Request& request )
{
    JSONValue           result;
    RequestParameters   parameters;

    if( !validateRequestParameters( request, { kDate, kCycle, kHour }, {}, result, parameters ) )
        return JSONResponse( std :: move( result ), 400 );

    return withQuery( [ this, &parameters ]( const ForecastQuery& query )
    {
        JSONValue   error;
        Response    response;

        auto samples = query.getSamples( parameters.date, parameters.cycle, parameters.hour );
        if( samples.empty() )
        {
            error[ kError ] = ServerErrors :: NO_HOUR_DATA;
            return JSONResponse( std :: move( error ), 404 );
        }

        auto raster = RasterSnapshot :: fromSamples( samples );
        if( raster.definedCellCount() == 0 )
        {
            error[ kError ] = ServerErrors :: NO_HOUR_VALUES;
            return JSONResponse( std :: move( error ), 404 );
        }

        // create unique image filename on UUID for concurrency safety
        std :: string uniqueImagePath = generateUniqueFileName( assetsPath_, PNG_EXT );

        {
            std :: lock_guard<std :: mutex> lock( renderMutex_ );
            renderer_.render( raster, countryBoundaries(),
                              "Wind Power Density - " + parameters.date + " Cycle " + parameters.cycle +
                              " +" + std :: to_string( parameters.hour ) + "h",
                              uniqueImagePath );
        }

        // give some time for the renderer to flush, check every 100 mills, time out after 2 seconds
        if( !waitForFile( uniqueImagePath, 2000, 100 ) )
        {
            error[ kError ] = ServerErrors :: PNG_TIMEOUT;
            return JSONResponse( std :: move( error ), 500 );
        }

        std :: ifstream file( uniqueImagePath, std :: ios :: binary );
        if( !file )
        {
            error[ kError ] = ServerErrors :: FAIL_O_IMG + uniqueImagePath;
            return JSONResponse( std :: move( error ), 500 );
        }

        std :: ostringstream imageBuffer;
        imageBuffer << file.rdbuf();
        file.close();

        response.code = 200;
        response.body = imageBuffer.str();

        response.set_header( "Content-Type", IMAGE_PNG );
        response.set_header( "Cache-Control", NO_CACHE_NO_STORE );

        // remove png
        std :: error_code ec;
        std :: filesystem :: remove( uniqueImagePath, ec );
        if( ec )
            CROW_LOG_WARNING << "Could not remove " << uniqueImagePath << ": " << ec.message();

        return response;
    } );
}

// load the boundary dataset on first use, then serve it from memory
const std :: vector<CountryPolygon>& ForecastServer :: countryBoundaries()
{
    {
        std :: shared_lock lock( boundariesMutex_ );
        if( boundariesCached_ )
            return cachedBoundaries_;
    }

    auto boundaries = polygons_.loadCountryPolygons();

    std :: unique_lock lock( boundariesMutex_ );
    if( !boundariesCached_ )
    {
        cachedBoundaries_ = std :: move( boundaries.countries );
        boundariesCached_ = true;
    }
    return cachedBoundaries_;
}

// random v4 UUID after the prefix, so concurrent /map requests never share a png
std :: string ForecastServer :: generateUniqueFileName( const std :: string& prefix, const std :: string& extension )
{
    static const char hexDigits[] = "0123456789abcdef";

    thread_local std :: mt19937 gen( std :: random_device {}() );
    std :: uniform_int_distribution<> nibble( 0, 15 );

    // x: any nibble, y: variant nibble 8..b
    std :: string uuid = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for( char& c : uuid )
    {
        if( c == 'x' )
            c = hexDigits[ nibble( gen ) ];
        else if( c == 'y' )
            c = hexDigits[ 8 + ( nibble( gen ) & 3 ) ];
    }
    return prefix + uuid + extension;
}

/*!
    matplot++ hands save() to its gnuplot child process, which creates the
    png name first and fills it after save() has returned. Poll until the
    file is non-empty or the deadline passes.
*/
bool ForecastServer :: waitForFile( const std :: string& path,
                                    int timeoutMs,
                                    int pollIntervalMs )
{
    using namespace std :: chrono;

    const auto deadline = steady_clock :: now() + milliseconds( timeoutMs );

    do
    {
        std :: error_code ec;
        auto size = std :: filesystem :: file_size( path, ec );
        if( !ec && size > 0 )
            return true;

        std :: this_thread :: sleep_for( milliseconds( pollIntervalMs ) );
    }
    while( steady_clock :: now() < deadline );

    return false;
}

// validate params and populate variables
bool ForecastServer :: validateRequestParameters( const Request& request,
                                                  const std :: vector<std :: string>& required,
                                                  const std :: vector<std :: string>& optional,
                                                  JSONValue& result,
                                                  RequestParameters& parameters )
{
    auto query      { request.url_params };

    // return error if a required parameter is missing
    for( const auto& key : required )
    {
        if( !query.get( key ) )
        {
            result[ kError ] = ServerErrors :: MISSING_PARMS + key + ".";
            return false;
        }
    }

    // reject request if any other parameters are included
    for( const auto& key : query.keys() )
    {
        std :: string name( key );
        bool known = std :: find( required.begin(), required.end(), name ) != required.end() ||
                     std :: find( optional.begin(), optional.end(), name ) != optional.end();
        if( !known )
        {
            result[ kError ] = ServerErrors :: INVALID_PARM + name + ".";
            return false;
        }
    }

    if( query.get( kDate ) )
        parameters.date = query.get( kDate );
    if( query.get( kCycle ) )
        parameters.cycle = query.get( kCycle );

    if( query.get( kHour ) )
    {
        try
        {
            parameters.hour     =   std :: stoi( query.get( kHour ) );
            parameters.hasHour  =   true;
        }
        catch( const std :: exception& e )
        {
            result[ kError ] = ServerErrors :: FAIL_STOI + e.what();
            return false;
        }
    }

    // shape checks here, the query layer checks the rest
    if( !parameters.date.empty() && !isValidDate( parameters.date ) )
    {
        result[ kError ] = Errors :: INVALID_DATE + parameters.date;
        return false;
    }
    if( !parameters.cycle.empty() && !isValidCycle( parameters.cycle ) )
    {
        result[ kError ] = Errors :: INVALID_CYCLE + parameters.cycle;
        return false;
    }

    return true;
}

// response object
Response ForecastServer :: JSONResponse( JSONValue json, int code )
{
    // set content-type header to application/json
    Response response;
    response.set_header( "Content-Type", APPLICATION_JSON );
    response.set_header( "Cache-Control", NO_CACHE_NO_STORE );

    response.code = code;

    // add indentation for readability
    response.body = json.dump( 3 );
    return response;
}

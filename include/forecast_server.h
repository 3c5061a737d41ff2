#ifndef FORECAST_SERVER_H
#define FORECAST_SERVER_H

#include "crow.h"
#include "country_boundaries.h"
#include "forecast_query.h"
#include "map_renderer.h"
#include "pipeline_config.h"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

using JSONValue = crow :: json :: wvalue;
using JSONList  = crow :: json :: wvalue :: list;

using Request   = crow :: request;
using Response  = crow :: response;

// JSON and header strings
const std :: string APPLICATION_JSON    =   "application/json";
const std :: string IMAGE_PNG           =   "image/png";
const std :: string NO_CACHE_NO_STORE   =   "no-cache, no-store";
const std :: string PNG_EXT             =   ".png";

// repeated keys
constexpr char kDate[]                  =   "date";
constexpr char kCycle[]                 =   "cycle";
constexpr char kHour[]                  =   "hour";

constexpr char kError[]                 =   "error";

// Error strings
namespace ServerErrors
{
    const std :: string FAIL_O_IMG      =   "ForecastServer :: handleGetMap: std :: ifstream: failed to open image file. ";
    const std :: string FAIL_STOI       =   "ForecastServer :: validateRequestParameters: std :: stoi: failed getting parameters. ";
    const std :: string FAIL_START      =   "ForecastServer :: run: Failed to start server. ";
    const std :: string MISSING_PARMS   =   "ForecastServer :: validateRequestParameters: Missing required parameter: ";
    const std :: string INVALID_PARM    =   "ForecastServer :: validateRequestParameters: Invalid parameter: ";
    const std :: string NO_HOUR_DATA    =   "ForecastServer :: handleGetMap: no samples for the requested forecast hour. ";
    const std :: string NO_HOUR_VALUES  =   "ForecastServer :: handleGetMap: every sample of the requested forecast hour is null. ";
    const std :: string PNG_TIMEOUT     =   "ForecastServer :: handleGetMap: Timed out waiting for png visualization. ";
}

// validated query parameters of one request
struct RequestParameters
{
    std :: string   date;
    std :: string   cycle;
    int             hour        =   0;
    bool            hasHour     =   false;
};

/*!
    HTTP front of ForecastQuery. Every request opens its own read-only store
    session, so concurrent viewers share nothing but the database file, and a
    request running while the pipeline writes sees the last committed state.
*/
class ForecastServer
{
    public:
        // ctor
        ForecastServer( const PipelineConfig& config, MapRenderer& renderer, PolygonSource& polygons );

        // crow server run method
        void        run         ( unsigned int port );

        // getters and setters
        std :: string getDatabasePath() const
        {
            return databasePath_;
        }

        // route handlers, public so they can be driven without a socket
        Response    handleGetDates          ();
        Response    handleGetCycles         ( const Request& request );
        Response    handleGetSamples        ( const Request& request );
        Response    handleGetRankings       ( const Request& request );
        Response    handleGetHourlyAverage  ( const Request& request );
        Response    handleGetMap            ( const Request& request );

    private:
        // class variables
        const std :: string         databasePath_;
        const std :: string         assetsPath_;
        MapRenderer&                renderer_;
        PolygonSource&              polygons_;

        crow :: SimpleApp           app_;

        // boundaries are read once and shared read-only between requests
        std :: shared_mutex                 boundariesMutex_;
        bool                                boundariesCached_;
        std :: vector<CountryPolygon>       cachedBoundaries_;

        // matplot++ drives one global gnuplot pipe
        std :: mutex                        renderMutex_;

        // class functions
        const std :: vector<CountryPolygon>&    countryBoundaries();

        bool        waitForFile                 ( const std :: string& path,
                                                  int timeoutMs,
                                                  int pollIntervalMs );

        std :: string generateUniqueFileName    ( const std :: string& prefix, const std :: string& extension );

        bool        validateRequestParameters   ( const Request& request,
                                                  const std :: vector<std :: string>& required,
                                                  const std :: vector<std :: string>& optional,
                                                  JSONValue& result,
                                                  RequestParameters& parameters );

        template <typename Handler>
        Response    withQuery                   ( Handler handler );

        Response    JSONResponse                ( JSONValue json, int code = 200 );
};

#endif

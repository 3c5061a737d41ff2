#include "command_line.h"
#include "country_boundaries.h"
#include "cycle_scheduler.h"
#include "extraction_stage.h"
#include "forecast_store.h"
#include "grid_source.h"
#include "pipeline_config.h"
#include "wpd_errors.h"

#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{
    bool nearly_equal( double a, double b, double tol = 1.0e-9 )
    {
        return std :: abs( a - b ) <= tol;
    }

    int expect_true( bool cond, const std :: string& message )
    {
        if( !cond )
        {
            std :: cerr << "[pipeline-regression] FAIL: " << message << std :: endl;
            return 1;
        }
        return 0;
    }

    std :: time_t utc( int year, int month, int day, int hour )
    {
        std :: tm tm {};
        tm.tm_year  =   year - 1900;
        tm.tm_mon   =   month - 1;
        tm.tm_mday  =   day;
        tm.tm_hour  =   hour;
        return timegm( &tm );
    }

    // 2x2 lattice per hour, one NaN cell
    class FakeGridSource : public GridSource
    {
        public:
            std :: vector<GridFrame> fetchGrid( const ForecastCycle& ) override
            {
                ++calls;
                if( failWith )
                    throw std :: runtime_error( "connection reset" );

                std :: vector<GridFrame> frames;
                for( int hour : hours )
                {
                    GridFrame frame;
                    frame.forecastHour  =   hour;
                    frame.lats          =   { 50.0, 50.25 };
                    frame.lons          =   { 10.0, 10.25 };
                    frame.u             =   { 3.0, 0.0, std :: nan( "" ), 6.0 };
                    frame.v             =   { 4.0, 0.0, 1.0, 8.0 };
                    frames.push_back( frame );
                }
                return frames;
            }

            std :: vector<int>  hours       =   { 0, 3 };
            bool                failWith    =   false;
            int                 calls       =   0;
    };

    std :: string writeFile( const std :: string& name, const std :: string& content )
    {
        auto path = std :: filesystem :: temp_directory_path() / name;
        std :: ofstream file( path, std :: ios :: trunc );
        file << content;
        return path.string();
    }

    int test_extraction_is_idempotent()
    {
        int failures = 0;

        FakeGridSource  source;
        ForecastStore   store( IN_MEMORY_DB );
        ExtractionStage stage( source, store, kAirDensity, []() { return utc( 2025, 8, 8, 12 ); } );

        std :: size_t first     =   stage.extract( "20250807", "00" );
        std :: size_t second    =   stage.extract( "20250807", "00" );

        const ForecastCycle cycle { "20250807", "00" };
        failures += expect_true( first == 8 && second == 8, "each run writes 2 hours x 4 cells" );
        failures += expect_true( store.countSamples( cycle ) == 8, "re-extraction must not duplicate rows" );

        auto hour0 = store.loadSamples( cycle, 0 );
        failures += expect_true( hour0.size() == 4, "hour 0 must hold four cells" );
        if( hour0.size() == 4 )
        {
            failures += expect_true( hour0[ 0 ].windPowerDensity && nearly_equal( *hour0[ 0 ].windPowerDensity, 76.5625 ),
                                     "( 3, 4 ) m/s must store 76.5625" );
            failures += expect_true( hour0[ 1 ].windPowerDensity && nearly_equal( *hour0[ 1 ].windPowerDensity, 0.0 ),
                                     "calm cell must store zero" );
            failures += expect_true( !hour0[ 2 ].windPowerDensity, "missing component must store null" );
        }
        return failures;
    }

    int test_extraction_errors()
    {
        int failures = 0;

        FakeGridSource  source;
        ForecastStore   store( IN_MEMORY_DB );
        ExtractionStage stage( source, store, kAirDensity, []() { return utc( 2025, 8, 8, 12 ); } );

        bool threw = false;
        try
        {
            stage.extract( "20250809", "00" );
        }
        catch( const StaleConfiguration& )
        {
            threw = true;
        }
        failures += expect_true( threw && source.calls == 0, "a future date is rejected before the source is asked" );

        source.failWith = true;
        threw = false;
        try
        {
            stage.extract( "20250807", "06" );
        }
        catch( const SourceUnavailable& )
        {
            threw = true;
        }
        failures += expect_true( threw, "a source error must surface as SourceUnavailable" );

        source.failWith = false;
        source.hours.clear();
        threw = false;
        try
        {
            stage.extract( "20250807", "06" );
        }
        catch( const SourceUnavailable& )
        {
            threw = true;
        }
        failures += expect_true( threw, "no frames at all must surface as SourceUnavailable" );
        failures += expect_true( store.countSamples( ForecastCycle { "20250807", "06" } ) == 0, "failed runs write nothing" );
        return failures;
    }

    int test_scheduler_halts_on_failure()
    {
        int failures = 0;
        int aggregateCalls = 0;

        CycleScheduler scheduler( []( const std :: string&, const std :: string& ) -> std :: size_t
                                  {
                                      throw SourceUnavailable( "no grid" );
                                  },
                                  [ &aggregateCalls ]( const std :: string&, const std :: string& ) -> std :: size_t
                                  {
                                      ++aggregateCalls;
                                      return 1;
                                  },
                                  std :: chrono :: seconds( 3600 ) );

        RunReport report = scheduler.runManual( "20250807", "00" );
        failures += expect_true( !report.succeeded(), "an extraction failure fails the run" );
        failures += expect_true( aggregateCalls == 0, "aggregation must not run after a failed extraction" );
        failures += expect_true( scheduler.state() == SchedulerState :: Failed, "scheduler must record FAILED" );
        failures += expect_true( report.error == "no grid", "the report carries the stage error" );

        RunReport invalid = scheduler.runManual( "20250807", "07" );
        failures += expect_true( !invalid.succeeded(), "an invalid cycle fails the run" );
        return failures;
    }

    int test_scheduler_manual_and_tick()
    {
        int failures = 0;
        std :: string extractedDate;
        std :: string extractedCycle;

        CycleScheduler scheduler( [ & ]( const std :: string& date, const std :: string& cycle ) -> std :: size_t
                                  {
                                      extractedDate     =   date;
                                      extractedCycle    =   cycle;
                                      return 8;
                                  },
                                  []( const std :: string&, const std :: string& ) -> std :: size_t
                                  {
                                      return 2;
                                  },
                                  std :: chrono :: seconds( 3600 ),
                                  []() { return utc( 2025, 8, 7, 3 ); } );

        RunReport manual = scheduler.runManual( "20250807", "12" );
        failures += expect_true( manual.succeeded() && manual.rowsWritten == 8 && manual.countriesRanked == 2,
                                 "manual run must report both stages" );
        failures += expect_true( scheduler.state() == SchedulerState :: Idle, "a finished run returns to IDLE" );

        RunReport scheduled = scheduler.tick();
        failures += expect_true( scheduled.succeeded() && extractedDate == "20250806" && extractedCycle == "18",
                                 "tick at 03Z must run the previous day's 18 cycle" );
        failures += expect_true( scheduler.ticks() == 1, "one tick counted" );
        failures += expect_true( std :: string( schedulerStateName( SchedulerState :: Aggregating ) ) == "AGGREGATING",
                                 "state names are upper case" );
        return failures;
    }

    int test_scheduler_stops()
    {
        int failures = 0;

        CycleScheduler scheduler( []( const std :: string&, const std :: string& ) -> std :: size_t { return 0; },
                                  []( const std :: string&, const std :: string& ) -> std :: size_t { return 0; },
                                  std :: chrono :: seconds( 3600 ),
                                  []() { return utc( 2025, 8, 7, 13 ); } );

        std :: thread loop( [ &scheduler ]() { scheduler.run(); } );

        auto deadline = std :: chrono :: steady_clock :: now() + std :: chrono :: seconds( 10 );
        while( scheduler.ticks() == 0 && std :: chrono :: steady_clock :: now() < deadline )
        {
            std :: this_thread :: sleep_for( std :: chrono :: milliseconds( 10 ) );
        }

        auto stopAt = std :: chrono :: steady_clock :: now();
        scheduler.stop();
        loop.join();
        auto waited = std :: chrono :: steady_clock :: now() - stopAt;

        failures += expect_true( scheduler.ticks() == 1, "the loop ticks once immediately" );
        failures += expect_true( waited < std :: chrono :: seconds( 5 ), "stop must not wait out the interval" );
        return failures;
    }

    int test_manual_command_line()
    {
        int failures = 0;
        const std :: time_t now = utc( 2025, 8, 7, 14 );

        const char* good[] = { "wpd_pipeline", "manual", "--date", "20250807", "--cycle", "06" };
        ForecastCycle target = manualTarget( parseCommandLine( 6, good ), now );
        failures += expect_true( target == ForecastCycle { "20250807", "06" }, "manual target is taken from --date and --cycle" );

        auto rejected = [ now ]( int argc, const char* const argv[] )
        {
            try
            {
                manualTarget( parseCommandLine( argc, argv ), now );
            }
            catch( const StaleConfiguration& )
            {
                return true;
            }
            return false;
        };

        const char* badCycle[]  = { "wpd_pipeline", "manual", "--date", "20250807", "--cycle", "03" };
        const char* noDate[]    = { "wpd_pipeline", "manual", "--cycle", "06" };
        const char* noCycle[]   = { "wpd_pipeline", "manual", "--date", "20250807" };
        const char* badDate[]   = { "wpd_pipeline", "manual", "--date", "2025-08-07", "--cycle", "06" };
        const char* future[]    = { "wpd_pipeline", "manual", "--date", "20250808", "--cycle", "00" };
        const char* unknown[]   = { "wpd_pipeline", "manual", "--date", "20250807", "--cycle", "06", "--port", "80" };
        const char* dangling[]  = { "wpd_pipeline", "manual", "--date" };

        failures += expect_true( rejected( 6, badCycle ), "cycle 03 is a configuration error" );
        failures += expect_true( rejected( 4, noDate ), "missing --date is a configuration error" );
        failures += expect_true( rejected( 4, noCycle ), "missing --cycle is a configuration error" );
        failures += expect_true( rejected( 6, badDate ), "a dashed date is a configuration error" );
        failures += expect_true( rejected( 6, future ), "a date after today is a configuration error" );
        failures += expect_true( rejected( 8, unknown ), "--port is not an option of manual mode" );
        failures += expect_true( rejected( 3, dangling ), "an option without a value is a configuration error" );

        const char* configOnly[] = { "wpd_pipeline", "serve", "--config", "x.json" };
        CommandLine serve = parseCommandLine( 4, configOnly );
        failures += expect_true( serve.mode == "serve" && option( serve, "config" ) == "x.json" &&
                                 option( serve, "port", "8080" ) == "8080", "options fall back when absent" );
        return failures;
    }

    int test_config_loading()
    {
        int failures = 0;

        PipelineConfig defaults = loadPipelineConfig( "/nonexistent/pipeline.json" );
        failures += expect_true( defaults.databasePath == "data/processed/gfs_data.db", "default database path" );
        failures += expect_true( defaults.serverPort == 8050, "default port 8050" );
        failures += expect_true( nearly_equal( defaults.airDensity, 1.225 ), "default air density" );

        auto hours = forecastHours( defaults.forecastHours );
        failures += expect_true( hours.size() == 25 && hours.front() == 0 && hours.back() == 72, "hours 0..72 step 3" );

        auto path = writeFile( "wpd_pipeline_config.json",
                               "{ \"database_path\": \"/tmp/wpd.db\", \"server_port\": 9000, \"log_level\": \"debug\","
                               "  \"bounds\": { \"lat_min\": 40, \"lat_max\": 60 },"
                               "  \"forecast_hours\": { \"end\": 24, \"step\": 6 } }" );
        PipelineConfig config = loadPipelineConfig( path );
        failures += expect_true( config.databasePath == "/tmp/wpd.db", "database_path overrides" );
        failures += expect_true( config.serverPort == 9000, "server_port overrides" );
        failures += expect_true( config.logLevel == crow :: LogLevel :: Debug, "log_level overrides" );
        failures += expect_true( nearly_equal( config.bounds.latMin, 40.0 ) && nearly_equal( config.bounds.lonMin, -10.0 ),
                                 "partial bounds keep the other defaults" );
        failures += expect_true( forecastHours( config.forecastHours ).size() == 5, "hours 0..24 step 6" );

        for( const std :: string& bad : { std :: string( "{ \"server_port\": \"eighty\" }" ),
                                          std :: string( "{ \"log_level\": \"loud\" }" ),
                                          std :: string( "{ \"forecast_hours\": { \"step\": 0 } }" ),
                                          std :: string( "not json" ) } )
        {
            bool threw = false;
            try
            {
                loadPipelineConfig( writeFile( "wpd_pipeline_bad.json", bad ) );
            }
            catch( const StaleConfiguration& )
            {
                threw = true;
            }
            failures += expect_true( threw, "malformed configuration must be rejected: " + bad );
        }

        std :: filesystem :: remove( path );
        std :: filesystem :: remove( std :: filesystem :: temp_directory_path() / "wpd_pipeline_bad.json" );
        return failures;
    }

    int test_geojson_parsing()
    {
        const std :: string document =
            "{ \"type\": \"FeatureCollection\", \"features\": ["
            "  { \"type\": \"Feature\", \"properties\": { \"NAME\": \"Alpland\", \"ISO_A3\": \"ALP\", \"CONTINENT\": \"Europe\" },"
            "    \"geometry\": { \"type\": \"Polygon\", \"coordinates\": [ [ [9.5,49],[10.5,49],[10.5,51],[9.5,51],[9.5,49] ],"
            "                                                                [ [9.8,49.5],[10,49.5],[10,50],[9.8,49.5] ] ] } },"
            "  { \"type\": \"Feature\", \"properties\": { \"name\": \"Isles\", \"continent\": \"Europe\" },"
            "    \"geometry\": { \"type\": \"MultiPolygon\", \"coordinates\": [ [ [ [0,0],[1,0],[1,1],[0,0] ] ],"
            "                                                                   [ [ [2,2],[3,2],[3,3],[2,2] ] ] ] } },"
            "  { \"type\": \"Feature\", \"properties\": { \"NAME\": \"Faraway\", \"CONTINENT\": \"Asia\" },"
            "    \"geometry\": { \"type\": \"Polygon\", \"coordinates\": [ [ [90,0],[91,0],[91,1],[90,0] ] ] } },"
            "  { \"type\": \"Feature\", \"properties\": { \"NAME\": \"Nowhere\" }, \"geometry\": null }"
            "] }";

        int failures = 0;

        auto boundaries = GeoJSONPolygonSource :: parse( document, "Europe" );
        failures += expect_true( boundaries.crs == WGS84_CRS, "no crs member means WGS84" );
        failures += expect_true( boundaries.countries.size() == 2, "other continents and null geometry are dropped" );
        if( boundaries.countries.size() == 2 )
        {
            const auto& alpland = boundaries.countries[ 0 ];
            failures += expect_true( alpland.name == "Alpland" && alpland.isoCode == "ALP", "NAME and ISO_A3 are read" );
            failures += expect_true( alpland.parts.size() == 1 && alpland.parts[ 0 ].holes.size() == 1,
                                     "polygon holes are kept" );
            failures += expect_true( boundaries.countries[ 1 ].parts.size() == 2, "multipolygon parts are kept" );
        }

        failures += expect_true( GeoJSONPolygonSource :: parse( document, "" ).countries.size() == 3,
                                 "an empty continent keeps every feature with geometry" );

        bool threw = false;
        try
        {
            GeoJSONPolygonSource :: parse( "{ \"features\": [ { \"properties\": { \"NAME\": \"Dot\" },"
                                           "  \"geometry\": { \"type\": \"Point\", \"coordinates\": [ 1, 2 ] } } ] }", "" );
        }
        catch( const PipelineError& )
        {
            threw = true;
        }
        failures += expect_true( threw, "point geometry must be rejected" );

        auto unnamed = GeoJSONPolygonSource :: parse(
            "{ \"features\": [ { \"properties\": null,"
            "  \"geometry\": { \"type\": \"Polygon\", \"coordinates\": [ [ [0,0],[1,0],[1,1],[0,0] ] ] } },"
            "  \"stray\","
            "  { \"properties\": { \"NAME\": \"Kept\" },"
            "    \"geometry\": { \"type\": \"Polygon\", \"coordinates\": [ [ [0,0],[1,0],[1,1],[0,0] ] ] } } ] }", "Europe" );
        failures += expect_true( unnamed.countries.size() == 1 && unnamed.countries[ 0 ].name == "Kept",
                                 "features with null properties or no object body are skipped" );

        auto malformed = [ ]( const std :: string& text )
        {
            try
            {
                GeoJSONPolygonSource :: parse( text, "" );
            }
            catch( const PipelineError& )
            {
                return true;
            }
            return false;
        };

        failures += expect_true( malformed( "{ \"crs\": \"EPSG:4326\", \"features\": [] }" ),
                                 "a crs given as a plain string is a boundary read error" );
        failures += expect_true( malformed( "{ \"crs\": { \"properties\": null }, \"features\": [] }" ),
                                 "a crs without properties is a boundary read error" );
        failures += expect_true( malformed( "[ 1, 2, 3 ]" ), "a top-level array is not a FeatureCollection" );
        failures += expect_true( malformed( "{ \"features\": { \"a\": 1 } }" ), "features must be a list" );
        failures += expect_true( malformed( "{ \"features\": [ { \"properties\": {}, \"geometry\": 7 } ] }" ),
                                 "a scalar geometry is rejected" );
        failures += expect_true( malformed( "{ \"features\": [ { \"properties\": {},"
                                            "  \"geometry\": { \"type\": \"Polygon\", \"coordinates\": [ [ [ \"a\", 1 ] ] ] } } ] }" ),
                                 "a non-numeric position is rejected" );
        failures += expect_true( GeoJSONPolygonSource :: parse( "{ \"crs\": { \"properties\": { \"name\": \"EPSG:3035\" } },"
                                                              "  \"features\": [] }", "" ).crs == "EPSG:3035",
                                 "a named crs is read" );
        failures += expect_true( !isGeographicWgs84( "EPSG:3035" ) && isGeographicWgs84( "urn:ogc:def:crs:OGC:1.3:CRS84" ),
                                 "projected CRS is not WGS84" );
        return failures;
    }
}

int main()
{
    crow :: logger :: setLogLevel( crow :: LogLevel :: Warning );

    int failures = 0;
    failures += test_extraction_is_idempotent();
    failures += test_extraction_errors();
    failures += test_scheduler_halts_on_failure();
    failures += test_scheduler_manual_and_tick();
    failures += test_scheduler_stops();
    failures += test_manual_command_line();
    failures += test_config_loading();
    failures += test_geojson_parsing();

    if( failures > 0 )
    {
        std :: cerr << "[pipeline-regression] FAILED with " << failures << " check(s)." << std :: endl;
        return 1;
    }

    std :: cout << "[pipeline-regression] all checks passed" << std :: endl;
    return 0;
}

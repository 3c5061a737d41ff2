#include "aggregation_stage.h"
#include "command_line.h"
#include "country_boundaries.h"
#include "cycle_scheduler.h"
#include "extraction_stage.h"
#include "forecast_server.h"
#include "forecast_store.h"
#include "grid_source.h"
#include "map_renderer.h"
#include "pipeline_config.h"
#include "wpd_errors.h"

#include <chrono>
#include <ctime>
#include <csignal>
#include <iostream>
#include <string>

namespace
{
    const std :: string USAGE =
        "usage: wpd_pipeline <mode> [options]\n"
        "  scheduler                                 periodic extraction + aggregation\n"
        "  manual --date YYYYMMDD --cycle 00|06|12|18 one run for an explicit cycle\n"
        "  serve [--port N]                          start the query server\n"
        "options:\n"
        "  --config <path>                           JSON configuration ( default " + DEFAULT_CONFIG_PATH + " )\n";

    CycleScheduler* activeScheduler = nullptr;

    void onSignal( int )
    {
        if( activeScheduler )
            activeScheduler->requestStop();
    }
}

int main( int argc, char* argv[] )
{
    CommandLine     commandLine;
    PipelineConfig  config;
    ForecastCycle   manual;

    try
    {
        commandLine = parseCommandLine( argc, argv );
        if( commandLine.mode == "manual" )
            manual  = manualTarget( commandLine, std :: time( nullptr ) );

        config      = loadPipelineConfig( option( commandLine, "config", DEFAULT_CONFIG_PATH ) );
        setupWorkspace( config );
    }
    catch( const std :: exception& e )
    {
        std :: cerr << e.what() << "\n" << USAGE;
        return 2;
    }

    try
    {
        /*--------*
        | serve   |
        *--------*/
        if( commandLine.mode == "serve" )
        {
            requireOnly( commandLine, { "port" } );

            unsigned int port = config.serverPort;
            if( !option( commandLine, "port" ).empty() )
                port = static_cast<unsigned int>( std :: stoul( option( commandLine, "port" ) ) );

            // schema has to exist before the first read-only session opens
            {
                ForecastStore schema( config.databasePath );
            }

            MatplotMapRenderer      renderer;
            GeoJSONPolygonSource    polygons( config.boundariesPath, config.continent );

            ForecastServer server( config, renderer, polygons );
            server.run( port );
            return 0;
        }

        if( commandLine.mode != "scheduler" && commandLine.mode != "manual" )
            throw StaleConfiguration( "unknown mode: " + commandLine.mode );

        ForecastStore           store( config.databasePath );
        NetCDFGridSource        grids( config.rawDataDir, config.bounds, forecastHours( config.forecastHours ) );
        GeoJSONPolygonSource    polygons( config.boundariesPath, config.continent );
        MatplotMapRenderer      renderer;

        ExtractionStage     extraction( grids, store, config.airDensity );
        AggregationStage    aggregation( store, polygons, renderer, config.plotsDir );

        CycleScheduler scheduler( [ &extraction ]( const std :: string& date, const std :: string& cycle )
                                  {
                                      return extraction.extract( date, cycle );
                                  },
                                  [ &aggregation ]( const std :: string& date, const std :: string& cycle )
                                  {
                                      return aggregation.aggregate( date, cycle );
                                  },
                                  std :: chrono :: hours( config.schedulerIntervalHours ) );

        /*---------*
        | manual   |
        *---------*/
        if( commandLine.mode == "manual" )
        {
            RunReport report = scheduler.runManual( manual.date, manual.cycle );
            if( !report.succeeded() )
            {
                std :: cerr << "Run " << report.target.label() << " failed: " << report.error << std :: endl;
                return 1;
            }

            std :: cout << "Run " << report.target.label() << " done: " << report.rowsWritten << " rows, "
                        << report.countriesRanked << " countries ranked" << std :: endl;
            return 0;
        }

        /*------------*
        | scheduler   |
        *------------*/
        requireOnly( commandLine, {} );

        activeScheduler = &scheduler;
        std :: signal( SIGINT, onSignal );
        std :: signal( SIGTERM, onSignal );

        scheduler.run();

        activeScheduler = nullptr;
        return 0;
    }
    catch( const StaleConfiguration& e )
    {
        std :: cerr << e.what() << "\n" << USAGE;
        return 2;
    }
    catch( const std :: exception& e )
    {
        std :: cerr << e.what() << std :: endl;
        return 1;
    }
}

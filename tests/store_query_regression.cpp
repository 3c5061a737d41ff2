#include "forecast_query.h"
#include "forecast_store.h"
#include "wpd_errors.h"

#include <sqlite3.h>

#include <cmath>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
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
            std :: cerr << "[store-query-regression] FAIL: " << message << std :: endl;
            return 1;
        }
        return 0;
    }

    ForecastSample sample( const std :: string& date, const std :: string& cycle,
                           double lat, double lon, int hour, std :: optional<double> wpd )
    {
        ForecastSample s;
        s.forecastDate      =   date;
        s.cycle             =   cycle;
        s.lat               =   lat;
        s.lon               =   lon;
        s.forecastHour      =   hour;
        s.windPowerDensity  =   wpd;
        return s;
    }

    // database laid out the way the first extractor wrote it: same columns, no keys
    std :: string legacyDatabase( const std :: string& name, bool withDuplicates )
    {
        auto path = ( std :: filesystem :: temp_directory_path() / name ).string();
        std :: filesystem :: remove( path );

        sqlite3* db = nullptr;
        sqlite3_open( path.c_str(), &db );
        sqlite3_exec( db,
                      "CREATE TABLE gfs_forecasts ( forecast_date TEXT, cycle TEXT, lat REAL, lon REAL,"
                      "  forecast_hour INTEGER, wind_power_density REAL );"
                      "CREATE TABLE country_rankings ( forecast_date TEXT, cycle TEXT, country TEXT,"
                      "  avg_wind_power_density REAL, rank INTEGER );"
                      "INSERT INTO gfs_forecasts VALUES ( '20250806', '18', 50.0, 10.0, 0, 42.0 );",
                      nullptr, nullptr, nullptr );
        if( withDuplicates )
        {
            sqlite3_exec( db, "INSERT INTO gfs_forecasts VALUES ( '20250806', '18', 50.0, 10.0, 0, 43.0 );",
                          nullptr, nullptr, nullptr );
        }
        sqlite3_close( db );
        return path;
    }

    int test_keys_added_to_legacy_tables()
    {
        int failures = 0;
        const std :: string path = legacyDatabase( "wpd_legacy_store.db", false );

        {
            ForecastStore store( path );
            const ForecastCycle cycle { "20250807", "00" };

            auto row = sample( "20250807", "00", 50.0, 10.0, 0, 100.0 );
            store.upsertSamples( { row } );
            store.upsertSamples( { row } );
            failures += expect_true( store.countSamples( cycle ) == 1, "a keyless legacy table must still upsert in place" );
            failures += expect_true( store.countSamples( ForecastCycle { "20250806", "18" } ) == 1,
                                     "existing legacy rows are kept" );

            store.replaceRankings( cycle, { { "20250807", "00", "Alpland", 1.0, 1 } } );
            store.replaceRankings( cycle, { { "20250807", "00", "Alpland", 2.0, 1 } } );
            failures += expect_true( store.loadRankings( cycle ).size() == 1, "legacy rankings table keeps one row per country" );
        }

        const std :: string dirty = legacyDatabase( "wpd_legacy_dirty.db", true );
        bool threw = false;
        try
        {
            ForecastStore store( dirty );
        }
        catch( const WriteFailure& )
        {
            threw = true;
        }
        failures += expect_true( threw, "a legacy table holding duplicate keys must be refused" );

        for( const auto& file : { path, dirty } )
        {
            std :: filesystem :: remove( file );
            std :: filesystem :: remove( file + "-wal" );
            std :: filesystem :: remove( file + "-shm" );
        }
        return failures;
    }

    int test_upsert_is_idempotent()
    {
        int failures = 0;
        ForecastStore store( IN_MEMORY_DB );
        const ForecastCycle cycle { "20250807", "00" };

        std :: vector<ForecastSample> batch =
        {
            sample( "20250807", "00", 50.0, 10.0, 0, 100.0 ),
            sample( "20250807", "00", 50.0, 10.25, 0, std :: nullopt ),
            sample( "20250807", "00", 50.0, 10.0, 3, 120.0 )
        };

        store.upsertSamples( batch );
        store.upsertSamples( batch );
        failures += expect_true( store.countSamples( cycle ) == 3, "a repeated batch must not add rows" );

        // same key, new value replaces the old row
        store.upsertSamples( { sample( "20250807", "00", 50.0, 10.0, 0, 150.0 ) } );
        auto hour0 = store.loadSamples( cycle, 0 );
        failures += expect_true( store.countSamples( cycle ) == 3, "a changed value must replace, not append" );
        failures += expect_true( hour0.size() == 2, "hour 0 must hold two cells" );
        failures += expect_true( !hour0.empty() && hour0[ 0 ].windPowerDensity &&
                                 nearly_equal( *hour0[ 0 ].windPowerDensity, 150.0 ),
                                 "the replaced cell must carry the new value" );
        failures += expect_true( hour0.size() == 2 && !hour0[ 1 ].windPowerDensity,
                                 "a null density must come back as null" );
        return failures;
    }

    int test_rankings_replaced_as_a_whole()
    {
        int failures = 0;
        ForecastStore store( IN_MEMORY_DB );
        const ForecastCycle cycle { "20250807", "12" };

        store.replaceRankings( cycle, { { "20250807", "12", "Alpland", 100.0, 1 },
                                        { "20250807", "12", "Seaside", 90.0, 2 },
                                        { "20250807", "12", "Lowland", 10.0, 3 } } );
        store.replaceRankings( cycle, { { "20250807", "12", "Seaside", 300.0, 1 },
                                        { "20250807", "12", "Alpland", 100.0, 2 } } );

        auto rankings = store.loadRankings( cycle );
        failures += expect_true( rankings.size() == 2, "stale countries must not survive a replace" );
        failures += expect_true( rankings.size() == 2 && rankings[ 0 ].country == "Seaside" && rankings[ 0 ].rank == 1,
                                 "rankings must load in rank order" );

        // other cycles are untouched
        store.replaceRankings( ForecastCycle { "20250807", "18" }, { { "20250807", "18", "Lowland", 5.0, 1 } } );
        failures += expect_true( store.loadRankings( cycle ).size() == 2, "replacing one cycle must leave others alone" );
        return failures;
    }

    int test_list_dates_newest_first()
    {
        int failures = 0;
        ForecastStore store( IN_MEMORY_DB );

        store.upsertSamples( { sample( "20250807", "00", 50.0, 10.0, 0, 1.0 ) } );
        store.upsertSamples( { sample( "20250808", "06", 50.0, 10.0, 0, 2.0 ) } );

        ForecastQuery query( store );
        auto dates = query.listDates();
        failures += expect_true( dates == std :: vector<std :: string>( { "20250808", "20250807" } ),
                                 "listDates must return 20250808 then 20250807" );

        store.upsertSamples( { sample( "20250808", "00", 50.0, 10.0, 0, 2.0 ) } );
        auto cycles = query.listCycles( "20250808" );
        failures += expect_true( cycles == std :: vector<std :: string>( { "00", "06" } ),
                                 "listCycles must return cycles in issuance order" );

        bool threw = false;
        try
        {
            query.listCycles( "2025-08-08" );
        }
        catch( const StaleConfiguration& )
        {
            threw = true;
        }
        failures += expect_true( threw, "a malformed date must be rejected" );
        return failures;
    }

    int test_hourly_average_skips_nulls()
    {
        int failures = 0;
        ForecastStore store( IN_MEMORY_DB );

        store.upsertSamples( { sample( "20250807", "06", 50.0, 10.0, 0, 100.0 ),
                               sample( "20250807", "06", 50.0, 10.25, 0, 300.0 ),
                               sample( "20250807", "06", 50.0, 10.5, 0, std :: nullopt ),
                               sample( "20250807", "06", 50.0, 10.0, 3, std :: nullopt ),
                               sample( "20250807", "06", 50.0, 10.0, 6, 50.0 ) } );

        ForecastQuery query( store );
        auto series = query.hourlyAverage( "20250807", "06" );

        failures += expect_true( series.size() == 3, "one point per forecast hour" );
        if( series.size() == 3 )
        {
            failures += expect_true( series[ 0 ].forecastHour == 0 && series[ 1 ].forecastHour == 3 &&
                                     series[ 2 ].forecastHour == 6, "hours must ascend" );
            failures += expect_true( series[ 0 ].avgWindPowerDensity &&
                                     nearly_equal( *series[ 0 ].avgWindPowerDensity, 200.0 ),
                                     "nulls must not drag the hour 0 mean down" );
            failures += expect_true( !series[ 1 ].avgWindPowerDensity, "an all-null hour has no average, not zero" );
        }

        failures += expect_true( query.getSamples( "20250807", "06", 0 ).size() == 3, "hour filter must apply" );
        failures += expect_true( query.getRanking( "20250807", "06" ).empty(), "unranked cycle gives an empty ranking" );
        return failures;
    }
}

int main()
{
    int failures = 0;
    failures += test_upsert_is_idempotent();
    failures += test_keys_added_to_legacy_tables();
    failures += test_rankings_replaced_as_a_whole();
    failures += test_list_dates_newest_first();
    failures += test_hourly_average_skips_nulls();

    if( failures > 0 )
    {
        std :: cerr << "[store-query-regression] FAILED with " << failures << " check(s)." << std :: endl;
        return 1;
    }

    std :: cout << "[store-query-regression] all checks passed" << std :: endl;
    return 0;
}

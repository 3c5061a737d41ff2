#include "forecast_cycle.h"
#include "wind_power.h"
#include "wpd_errors.h"

#include <cmath>
#include <ctime>
#include <iostream>
#include <string>

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
            std :: cerr << "[metric-cycle-regression] FAIL: " << message << std :: endl;
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

    int test_wind_power_density_formula()
    {
        int failures = 0;

        // |( 3, 4 )| = 5, 0.5 * 1.225 * 125
        auto wpd = windPowerDensity( 3.0, 4.0 );
        failures += expect_true( wpd.has_value(), "finite components must give a value" );
        failures += expect_true( wpd && nearly_equal( *wpd, 76.5625 ), "wpd( 3, 4 ) must be 76.5625" );

        auto calm = windPowerDensity( 0.0, 0.0 );
        failures += expect_true( calm && nearly_equal( *calm, 0.0 ), "calm air must give exactly zero" );

        auto dense = windPowerDensity( 3.0, 4.0, 2.0 * kAirDensity );
        failures += expect_true( dense && wpd && nearly_equal( *dense, 2.0 * *wpd ), "wpd must scale with air density" );

        auto cubic = windPowerDensityFromSpeed( 10.0 );
        failures += expect_true( cubic && nearly_equal( *cubic, 612.5 ), "wpd( 10 m/s ) must be 612.5" );
        return failures;
    }

    int test_missing_components_stay_null()
    {
        int failures = 0;
        failures += expect_true( !windPowerDensity( std :: nan( "" ), 1.0 ), "NaN u must give null, not zero" );
        failures += expect_true( !windPowerDensity( 1.0, INFINITY ), "infinite v must give null" );
        failures += expect_true( !windSpeed( std :: nan( "" ), std :: nan( "" ) ), "all-missing speed must be null" );
        failures += expect_true( !windPowerDensityFromSpeed( -1.0 ), "negative speed must give null" );
        return failures;
    }

    int test_cycle_and_date_validation()
    {
        int failures = 0;

        failures += expect_true( isValidCycle( "00" ) && isValidCycle( "18" ), "00 and 18 are cycles" );
        failures += expect_true( !isValidCycle( "03" ) && !isValidCycle( "6" ), "03 and 6 are not cycles" );
        failures += expect_true( isValidDate( "20240229" ), "leap day 2024 is a date" );
        failures += expect_true( !isValidDate( "20250229" ), "29 Feb 2025 is not a date" );
        failures += expect_true( !isValidDate( "2025-08-07" ), "dashed dates are rejected" );

        bool threw = false;
        try
        {
            parseForecastCycle( "20250807", "03" );
        }
        catch( const StaleConfiguration& )
        {
            threw = true;
        }
        failures += expect_true( threw, "cycle 03 must raise StaleConfiguration" );

        threw = false;
        try
        {
            requireAvailableDate( "20250808", utc( 2025, 8, 7, 23 ) );
        }
        catch( const StaleConfiguration& )
        {
            threw = true;
        }
        failures += expect_true( threw, "a date after today must raise StaleConfiguration" );

        threw = false;
        try
        {
            requireAvailableDate( "20250807", utc( 2025, 8, 7, 0 ) );
        }
        catch( const StaleConfiguration& )
        {
            threw = true;
        }
        failures += expect_true( !threw, "today is an available date" );
        return failures;
    }

    int test_target_cycle_lookup()
    {
        int failures = 0;

        failures += expect_true( targetCycleFor( utc( 2025, 8, 7, 3 ) ) == ForecastCycle { "20250806", "18" },
                                 "03Z must target the previous day's 18 cycle" );
        failures += expect_true( targetCycleFor( utc( 2025, 8, 7, 6 ) ) == ForecastCycle { "20250807", "00" },
                                 "06Z must target 00" );
        failures += expect_true( targetCycleFor( utc( 2025, 8, 7, 14 ) ) == ForecastCycle { "20250807", "06" },
                                 "14Z must target 06" );
        failures += expect_true( targetCycleFor( utc( 2025, 8, 7, 23 ) ) == ForecastCycle { "20250807", "12" },
                                 "23Z must target 12" );
        failures += expect_true( targetCycleFor( utc( 2025, 3, 1, 2 ) ) == ForecastCycle { "20250228", "18" },
                                 "early 1 March must roll back to 28 February" );
        return failures;
    }

    int test_forecast_day()
    {
        int failures = 0;
        failures += expect_true( forecastDay( "20250807", 0 ) == "20250807", "hour 0 is the run day" );
        failures += expect_true( forecastDay( "20250807", 21 ) == "20250807", "hour 21 is still the run day" );
        failures += expect_true( forecastDay( "20250807", 24 ) == "20250808", "hour 24 is the next day" );
        failures += expect_true( forecastDay( "20251231", 72 ) == "20260103", "hours roll over the year" );
        return failures;
    }
}

int main()
{
    int failures = 0;
    failures += test_wind_power_density_formula();
    failures += test_missing_components_stay_null();
    failures += test_cycle_and_date_validation();
    failures += test_target_cycle_lookup();
    failures += test_forecast_day();

    if( failures > 0 )
    {
        std :: cerr << "[metric-cycle-regression] FAILED with " << failures << " check(s)." << std :: endl;
        return 1;
    }

    std :: cout << "[metric-cycle-regression] all checks passed" << std :: endl;
    return 0;
}

#include "cycle_scheduler.h"
#include "wpd_errors.h"

#include "crow/logging.h"

#include <algorithm>

namespace
{
    // longest stretch the loop sleeps without looking at the stop flag
    constexpr std :: chrono :: seconds kPollSlice { 1 };
}

const char* schedulerStateName( SchedulerState state )
{
    switch( state )
    {
        case SchedulerState :: Idle:        return "IDLE";
        case SchedulerState :: Extracting:  return "EXTRACTING";
        case SchedulerState :: Aggregating: return "AGGREGATING";
        case SchedulerState :: Failed:      return "FAILED";
    }
    return "UNKNOWN";
}

CycleScheduler :: CycleScheduler( StageFn extract,
                                  StageFn aggregate,
                                  std :: chrono :: seconds interval,
                                  Clock clock ) : extract_( std :: move( extract ) ),
                                                  aggregate_( std :: move( aggregate ) ),
                                                  interval_( interval ),
                                                  clock_( std :: move( clock ) ),
                                                  state_( SchedulerState :: Idle ),
                                                  ticks_( 0 ),
                                                  stopRequested_( false )
{
}

RunReport CycleScheduler :: runManual( const std :: string& date, const std :: string& cycle )
{
    CROW_LOG_INFO << "Manual run for date " << date << " cycle " << cycle;
    return runPipeline( date, cycle );
}

RunReport CycleScheduler :: tick()
{
    ++ticks_;

    ForecastCycle target = targetCycleFor( clock_() );
    CROW_LOG_INFO << "Scheduled run " << ticks_.load() << " for " << target.label();

    return runPipeline( target.date, target.cycle );
}

void CycleScheduler :: run()
{
    using namespace std :: chrono;

    CROW_LOG_INFO << "Scheduler started, interval " << interval_.count() << "s";

    while( !stopRequested_.load() )
    {
        RunReport report = tick();
        if( !report.succeeded() )
            CROW_LOG_WARNING << "Run for " << report.target.label() << " failed, waiting for next tick";

        auto deadline = steady_clock :: now() + interval_;

        std :: unique_lock<std :: mutex> lock( waitMutex_ );
        while( !stopRequested_.load() && steady_clock :: now() < deadline )
        {
            auto remaining = duration_cast<milliseconds>( deadline - steady_clock :: now() );
            waitCv_.wait_for( lock, std :: min<milliseconds>( remaining, kPollSlice ),
                              [ this ] { return stopRequested_.load(); } );
        }
    }

    CROW_LOG_INFO << "Scheduler stopped after " << ticks_.load() << " ticks";
}

void CycleScheduler :: stop()
{
    {
        std :: lock_guard<std :: mutex> lock( waitMutex_ );
        stopRequested_.store( true );
    }
    waitCv_.notify_all();
}

RunReport CycleScheduler :: runPipeline( const std :: string& date, const std :: string& cycle )
{
    RunReport report;
    report.target = ForecastCycle { date, cycle };

    // bad input never reaches a stage
    try
    {
        parseForecastCycle( date, cycle );
    }
    catch( const StaleConfiguration& e )
    {
        fail( report, "validation", e );
        return report;
    }

    /*------------*
    | extraction  |
    *------------*/
    state_.store( SchedulerState :: Extracting );
    try
    {
        report.rowsWritten = extract_( date, cycle );
    }
    catch( const std :: exception& e )
    {
        fail( report, "extraction", e );
        return report;
    }

    /*-------------*
    | aggregation  |
    *-------------*/
    state_.store( SchedulerState :: Aggregating );
    try
    {
        report.countriesRanked = aggregate_( date, cycle );
    }
    catch( const std :: exception& e )
    {
        fail( report, "aggregation", e );
        return report;
    }

    state_.store( SchedulerState :: Idle );
    report.state = SchedulerState :: Idle;

    CROW_LOG_INFO << "Pipeline finished for " << report.target.label() << ": "
                  << report.rowsWritten << " rows, " << report.countriesRanked << " countries ranked";
    return report;
}

void CycleScheduler :: fail( RunReport& report, const char* stage, const std :: exception& e )
{
    state_.store( SchedulerState :: Failed );
    report.state = SchedulerState :: Failed;
    report.error = e.what();

    CROW_LOG_ERROR << "Halting pipeline for " << report.target.label() << ", " << stage << " failed: " << e.what();
}

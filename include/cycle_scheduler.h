#ifndef CYCLE_SCHEDULER_H
#define CYCLE_SCHEDULER_H

#include "forecast_cycle.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>

enum class SchedulerState
{
    Idle,
    Extracting,
    Aggregating,
    Failed
};

const char* schedulerStateName( SchedulerState state );

// outcome of one extraction -> aggregation run
struct RunReport
{
    ForecastCycle       target;
    SchedulerState      state           =   SchedulerState :: Idle;
    std :: size_t       rowsWritten     =   0;
    std :: size_t       countriesRanked =   0;
    std :: string       error;

    bool succeeded() const
    {
        return state != SchedulerState :: Failed;
    }
};

/*!
    Sequences Extraction then Aggregation for one cycle, strictly one after
    the other, and stops the run at the first stage that throws. A failed run
    leaves the scheduler in Failed; the periodic loop itself keeps going and
    the next tick starts a fresh run.

        IDLE -> EXTRACTING -> AGGREGATING -> IDLE
                    |              |
                    +--> FAILED <--+
*/
class CycleScheduler
{
    public:
        using StageFn   =   std :: function<std :: size_t( const std :: string&, const std :: string& )>;
        using Clock     =   std :: function<std :: time_t()>;

        CycleScheduler( StageFn extract,
                        StageFn aggregate,
                        std :: chrono :: seconds interval,
                        Clock clock = []() { return std :: time( nullptr ); } );

        // explicit ( date, cycle ), runs once and blocks until done
        RunReport       runManual   ( const std :: string& date, const std :: string& cycle );

        // one run on the cycle picked from the wall clock
        RunReport       tick        ();

        /*!
            Tick immediately, then once per interval until stop(). The wait
            between ticks is the only place the loop can be interrupted; a
            stage that is running finishes first.
        */
        void            run         ();

        // wakes the loop at once, safe to call from another thread
        void            stop        ();

        // only flips the flag, safe inside a signal handler; seen within a poll slice
        void            requestStop () { stopRequested_.store( true ); }

        SchedulerState  state       () const { return state_.load(); }
        std :: size_t   ticks       () const { return ticks_.load(); }
        bool            stopRequested() const { return stopRequested_.load(); }

    private:
        StageFn                         extract_;
        StageFn                         aggregate_;
        const std :: chrono :: seconds  interval_;
        Clock                           clock_;

        std :: atomic<SchedulerState>   state_;
        std :: atomic<std :: size_t>    ticks_;
        std :: atomic<bool>             stopRequested_;

        std :: mutex                    waitMutex_;
        std :: condition_variable       waitCv_;

        RunReport       runPipeline ( const std :: string& date, const std :: string& cycle );
        void            fail        ( RunReport& report, const char* stage, const std :: exception& e );
};

#endif

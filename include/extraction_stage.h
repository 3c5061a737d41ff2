#ifndef EXTRACTION_STAGE_H
#define EXTRACTION_STAGE_H

#include "forecast_store.h"
#include "grid_source.h"
#include "wind_power.h"

#include <cstddef>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

/*!
    Pulls the raw grid of one cycle, derives wind power density per cell and
    upserts one ForecastSample per ( cell, forecast hour ). Each forecast hour
    is committed on its own, so an interrupted run leaves whole hours behind
    and a re-run simply overwrites them.
*/
class ExtractionStage
{
    public:
        using Clock = std :: function<std :: time_t()>;

        ExtractionStage( GridSource& source,
                         ForecastStore& store,
                         double airDensity = kAirDensity,
                         Clock clock = []() { return std :: time( nullptr ); } );

        /*!
            Returns the number of rows written. Throws StaleConfiguration for a
            bad cycle or a future date before touching the source,
            SourceUnavailable when the source has nothing for the cycle and
            WriteFailure when the store rejects a batch.
        */
        std :: size_t   extract( const std :: string& date, const std :: string& cycle );

        // metric per cell of one frame, NaN components become null samples
        static std :: vector<ForecastSample> deriveSamples( const ForecastCycle& cycle,
                                                            const GridFrame& frame,
                                                            double airDensity = kAirDensity );

    private:
        GridSource&         source_;
        ForecastStore&      store_;
        const double        airDensity_;
        Clock               clock_;
};

#endif

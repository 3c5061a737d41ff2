#include "extraction_stage.h"
#include "wpd_errors.h"

#include "crow/logging.h"

ExtractionStage :: ExtractionStage( GridSource& source,
                                    ForecastStore& store,
                                    double airDensity,
                                    Clock clock ) : source_( source ),
                                                    store_( store ),
                                                    airDensity_( airDensity ),
                                                    clock_( std :: move( clock ) )
{
}

std :: size_t ExtractionStage :: extract( const std :: string& date, const std :: string& cycle )
{
    // reject before any I/O
    ForecastCycle target = parseForecastCycle( date, cycle );
    requireAvailableDate( target.date, clock_() );

    CROW_LOG_INFO << "Extracting cycle " << target.label();

    std :: vector<GridFrame> frames;
    try
    {
        frames = source_.fetchGrid( target );
    }
    catch( const PipelineError& )
    {
        throw;
    }
    catch( const std :: exception& e )
    {
        throw SourceUnavailable( Errors :: FAIL_R_GRID + target.label() + ": " + e.what() );
    }

    if( frames.empty() )
        throw SourceUnavailable( Errors :: NO_FRAMES + target.label() );

    std :: size_t written = 0;
    for( const auto& frame : frames )
    {
        auto samples = deriveSamples( target, frame, airDensity_ );
        store_.upsertSamples( samples );
        written += samples.size();

        CROW_LOG_DEBUG << "Stored " << samples.size() << " samples for forecast hour " << frame.forecastHour;
    }

    CROW_LOG_INFO << "Completed extraction for " << target.label() << ": "
                  << written << " rows over " << frames.size() << " forecast hours";
    return written;
}

std :: vector<ForecastSample> ExtractionStage :: deriveSamples( const ForecastCycle& cycle,
                                                                const GridFrame& frame,
                                                                double airDensity )
{
    std :: vector<ForecastSample> samples;
    samples.reserve( frame.cellCount() );

    const std :: size_t cols = frame.lons.size();

    for( std :: size_t i = 0; i < frame.lats.size(); i++ )
    {
        for( std :: size_t j = 0; j < cols; j++ )
        {
            ForecastSample sample;
            sample.forecastDate     =   cycle.date;
            sample.cycle            =   cycle.cycle;
            sample.lat              =   frame.lats[ i ];
            sample.lon              =   frame.lons[ j ];
            sample.forecastHour     =   frame.forecastHour;
            sample.windPowerDensity =   windPowerDensity( frame.u.at( i * cols + j ),
                                                          frame.v.at( i * cols + j ),
                                                          airDensity );
            samples.push_back( std :: move( sample ) );
        }
    }
    return samples;
}

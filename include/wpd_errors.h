#ifndef WPD_ERRORS_H
#define WPD_ERRORS_H

#include <stdexcept>
#include <string>

/*!
    Base of every error the pipeline raises on purpose. Stage errors are never
    swallowed inside a stage: they travel up to the scheduler or the CLI, which
    decide what the run's outcome is.
*/
class PipelineError : public std :: runtime_error
{
    public:
        explicit PipelineError( const std :: string& message ) : std :: runtime_error( message ) {}
};

// upstream grid data missing or unreachable
class SourceUnavailable : public PipelineError
{
    public:
        using PipelineError :: PipelineError;
};

// store query for the requested cycle returned nothing
class NoDataFound : public PipelineError
{
    public:
        using PipelineError :: PipelineError;
};

// store unreachable or a statement failed while writing
class WriteFailure : public PipelineError
{
    public:
        using PipelineError :: PipelineError;
};

// request or configuration outside the accepted set, rejected before any I/O
class StaleConfiguration : public PipelineError
{
    public:
        using PipelineError :: PipelineError;
};

// Error strings
namespace Errors
{
    // forecast cycle
    const std :: string INVALID_CYCLE   =   "ForecastCycle :: parseForecastCycle: cycle must be one of 00, 06, 12, 18, got: ";
    const std :: string INVALID_DATE    =   "ForecastCycle :: parseForecastCycle: date must be a calendar date in YYYYMMDD form, got: ";
    const std :: string FUTURE_DATE     =   "ForecastCycle :: requireAvailableDate: date is later than today (UTC): ";

    // configuration
    const std :: string FAIL_R_CONFIG   =   "PipelineConfig :: loadPipelineConfig: failed to parse configuration file: ";
    const std :: string BAD_CONFIG_KEY  =   "PipelineConfig :: loadPipelineConfig: invalid value for key: ";
    const std :: string BAD_LOG_LEVEL   =   "PipelineConfig :: parseLogLevel: unknown log level: ";
    const std :: string FAIL_MKDIR      =   "PipelineConfig :: setupWorkspace: failed to create directory: ";

    // forecast store
    const std :: string FAIL_O_DB       =   "ForecastStore :: ForecastStore: failed to open database: ";
    const std :: string FAIL_SCHEMA     =   "ForecastStore :: createSchema: failed to create schema: ";
    const std :: string FAIL_PREPARE    =   "ForecastStore :: prepare: failed to prepare statement: ";
    const std :: string FAIL_INSERT     =   "ForecastStore :: upsertSamples: failed to write forecast sample: ";
    const std :: string FAIL_REPLACE    =   "ForecastStore :: replaceRankings: failed to replace country rankings: ";
    const std :: string FAIL_TXN        =   "ForecastStore :: Transaction: failed to run transaction statement: ";
    const std :: string FAIL_READ       =   "ForecastStore :: query: failed to read from store: ";

    // grid source
    const std :: string MISSING_GRID    =   "NetCDFGridSource :: fetchGrid: no grid file for cycle: ";
    const std :: string FAIL_R_GRID     =   "NetCDFGridSource :: fetchGrid: failed to read grid file: ";
    const std :: string MISSING_VAR     =   "NetCDFGridSource :: fetchGrid: grid file is missing variable: ";
    const std :: string EMPTY_SUBSET    =   "NetCDFGridSource :: fetchGrid: no grid points inside the configured bounds. ";
    const std :: string NO_FRAMES       =   "ExtractionStage :: extract: grid source supplied no forecast hours for cycle: ";

    // boundaries
    const std :: string FAIL_R_BOUNDS   =   "GeoJSONPolygonSource :: loadCountryPolygons: failed to read boundary file: ";
    const std :: string BAD_GEOMETRY    =   "GeoJSONPolygonSource :: loadCountryPolygons: unsupported geometry for feature: ";
    const std :: string BAD_CRS         =   "AggregationStage :: aggregate: country polygons are not in geographic WGS84: ";

    // aggregation
    const std :: string NO_SAMPLES      =   "AggregationStage :: aggregate: no forecast samples stored for cycle: ";
    const std :: string FAIL_W_CSV      =   "AggregationStage :: writeRankingCsv: failed to open ranking export: ";
    const std :: string GRID_EMPTY      =   "MatplotMapRenderer :: render: raster has no defined cells. ";
    const std :: string FAIL_S_IMG      =   "MatplotMapRenderer :: render: error while saving image: ";
}

#endif

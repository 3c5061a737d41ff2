#ifndef PIPELINE_CONFIG_H
#define PIPELINE_CONFIG_H

#include "crow/logging.h"

#include <string>
#include <vector>

// default configuration file, missing file means compiled-in defaults
const std :: string DEFAULT_CONFIG_PATH =   "config/pipeline.json";

// lat/lon window the grid is cut to before anything is derived
struct GeoBounds
{
    double  latMin  =   35.0;
    double  latMax  =   70.0;
    double  lonMin  =  -10.0;
    double  lonMax  =   40.0;

    bool contains( double lat, double lon ) const
    {
        return lat >= latMin && lat <= latMax && lon >= lonMin && lon <= lonMax;
    }
};

// forecast hours offered by the grid source, inclusive
struct ForecastHourRange
{
    int     start   =   0;
    int     end     =   72;
    int     step    =   3;
};

struct PipelineConfig
{
    std :: string       databasePath            =   "data/processed/gfs_data.db";
    std :: string       rawDataDir              =   "data/raw";
    std :: string       plotsDir                =   "plots";
    std :: string       boundariesPath          =   "data/geospatial/ne_110m_admin_0_countries.geojson";
    std :: string       continent               =   "Europe";
    GeoBounds           bounds;
    ForecastHourRange   forecastHours;
    int                 schedulerIntervalHours  =   6;
    unsigned int        serverPort              =   8050;
    crow :: LogLevel    logLevel                =   crow :: LogLevel :: Info;
    double              airDensity              =   1.225;
};

/*!
    Read a JSON configuration file on top of the defaults. Keys that are
    absent keep their default; keys with the wrong type or an out of range
    value raise StaleConfiguration. A missing file is not an error.
*/
PipelineConfig          loadPipelineConfig  ( const std :: string& path );

// expands the configured range, e.g. 0, 3, 6 ... 72
std :: vector<int>      forecastHours       ( const ForecastHourRange& range );

crow :: LogLevel        parseLogLevel       ( const std :: string& name );

/*!
    One-time process setup, run before any pipeline work: applies the log
    level and creates the data and plot directories.
*/
void                    setupWorkspace      ( const PipelineConfig& config );

#endif

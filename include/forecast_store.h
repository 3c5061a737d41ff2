#ifndef FORECAST_STORE_H
#define FORECAST_STORE_H

#include "forecast_cycle.h"

#include <sqlite3.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// in-memory database, used by tests and dry runs
const std :: string IN_MEMORY_DB    =   ":memory:";

// one row of gfs_forecasts, keyed by ( date, cycle, lat, lon, hour )
struct ForecastSample
{
    std :: string               forecastDate;
    std :: string               cycle;
    double                      lat             =   0.0;
    double                      lon             =   0.0;
    int                         forecastHour    =   0;
    std :: optional<double>     windPowerDensity;
};

// one row of country_rankings, rank 1 = highest average
struct CountryRanking
{
    std :: string   forecastDate;
    std :: string   cycle;
    std :: string   country;
    double          avgWindPowerDensity =   0.0;
    int             rank                =   0;
};

/*!
    SQLite-backed owner of the gfs_forecasts and country_rankings tables.

    Samples are written with INSERT OR REPLACE on the 5-tuple key so a re-run
    of the same cycle never accumulates duplicates. Rankings for a cycle are
    replaced as a whole inside one transaction. The database runs in WAL mode
    so a reader in another process sees either side of a commit, never a
    partial one.

    One instance is one connection; it is not meant to be shared between
    threads.
*/
class ForecastStore
{
    public:
        enum class Mode
        {
            ReadWrite,
            ReadOnly
        };

        // ctor, creates the schema in ReadWrite mode
        explicit    ForecastStore   ( const std :: string& path, Mode mode = Mode :: ReadWrite );
                    ~ForecastStore  ();

        ForecastStore( const ForecastStore& )             =   delete;
        ForecastStore& operator=( const ForecastStore& )  =   delete;

        // write path
        void        upsertSamples   ( const std :: vector<ForecastSample>& samples );
        void        replaceRankings ( const ForecastCycle& cycle,
                                      const std :: vector<CountryRanking>& rankings );

        // read path
        std :: vector<ForecastSample>   loadSamples ( const ForecastCycle& cycle ) const;
        std :: vector<ForecastSample>   loadSamples ( const ForecastCycle& cycle, int forecastHour ) const;
        std :: size_t                   countSamples( const ForecastCycle& cycle ) const;
        std :: vector<CountryRanking>   loadRankings( const ForecastCycle& cycle ) const;
        std :: vector<std :: string>    listDates   () const;
        std :: vector<std :: string>    listCycles  ( const std :: string& date ) const;

        const std :: string& getPath() const
        {
            return path_;
        }

    private:
        const std :: string     path_;
        sqlite3*                db_;

        void                    createSchema();
};

#endif

#include "forecast_store.h"
#include "wpd_errors.h"

#include "crow/logging.h"

#include <memory>

namespace
{
    using Statement = std :: unique_ptr<sqlite3_stmt, decltype( &sqlite3_finalize )>;

    constexpr char kCreateForecasts[] =
        "CREATE TABLE IF NOT EXISTS gfs_forecasts ("
        "  forecast_date TEXT NOT NULL,"
        "  cycle TEXT NOT NULL,"
        "  lat REAL NOT NULL,"
        "  lon REAL NOT NULL,"
        "  forecast_hour INTEGER NOT NULL,"
        "  wind_power_density REAL,"
        "  UNIQUE ( forecast_date, cycle, lat, lon, forecast_hour )"
        ");";

    constexpr char kCreateRankings[] =
        "CREATE TABLE IF NOT EXISTS country_rankings ("
        "  forecast_date TEXT NOT NULL,"
        "  cycle TEXT NOT NULL,"
        "  country TEXT NOT NULL,"
        "  avg_wind_power_density REAL,"
        "  rank INTEGER NOT NULL,"
        "  UNIQUE ( forecast_date, cycle, country )"
        ");";

    // keys as indexes too, so a table created without them still gets them
    constexpr char kForecastsKey[] =
        "CREATE UNIQUE INDEX IF NOT EXISTS gfs_forecasts_key "
        "ON gfs_forecasts ( forecast_date, cycle, lat, lon, forecast_hour );";

    constexpr char kRankingsKey[] =
        "CREATE UNIQUE INDEX IF NOT EXISTS country_rankings_key "
        "ON country_rankings ( forecast_date, cycle, country );";

    constexpr char kUpsertSample[] =
        "INSERT OR REPLACE INTO gfs_forecasts "
        "( forecast_date, cycle, lat, lon, forecast_hour, wind_power_density ) "
        "VALUES ( ?, ?, ?, ?, ?, ? )";

    constexpr char kSelectSamples[] =
        "SELECT forecast_date, cycle, lat, lon, forecast_hour, wind_power_density "
        "FROM gfs_forecasts WHERE forecast_date = ? AND cycle = ? "
        "ORDER BY forecast_hour, lat, lon";

    constexpr char kSelectHourSamples[] =
        "SELECT forecast_date, cycle, lat, lon, forecast_hour, wind_power_density "
        "FROM gfs_forecasts WHERE forecast_date = ? AND cycle = ? AND forecast_hour = ? "
        "ORDER BY lat, lon";

    constexpr char kCountSamples[] =
        "SELECT COUNT(*) FROM gfs_forecasts WHERE forecast_date = ? AND cycle = ?";

    constexpr char kDeleteRankings[] =
        "DELETE FROM country_rankings WHERE forecast_date = ? AND cycle = ?";

    constexpr char kInsertRanking[] =
        "INSERT INTO country_rankings "
        "( forecast_date, cycle, country, avg_wind_power_density, rank ) "
        "VALUES ( ?, ?, ?, ?, ? )";

    constexpr char kSelectRankings[] =
        "SELECT forecast_date, cycle, country, avg_wind_power_density, rank "
        "FROM country_rankings WHERE forecast_date = ? AND cycle = ? ORDER BY rank";

    constexpr char kSelectDates[] =
        "SELECT DISTINCT forecast_date FROM gfs_forecasts ORDER BY forecast_date DESC";

    constexpr char kSelectCycles[] =
        "SELECT DISTINCT cycle FROM gfs_forecasts WHERE forecast_date = ? ORDER BY cycle";

    template <typename ErrorT>
    Statement prepare( sqlite3* db, const char* sql )
    {
        sqlite3_stmt* raw = nullptr;
        if( sqlite3_prepare_v2( db, sql, -1, &raw, nullptr ) != SQLITE_OK )
        {
            sqlite3_finalize( raw );
            throw ErrorT( Errors :: FAIL_PREPARE + sqlite3_errmsg( db ) );
        }
        return Statement( raw, &sqlite3_finalize );
    }

    void bindText( sqlite3_stmt* stmt, int index, const std :: string& value )
    {
        sqlite3_bind_text( stmt, index, value.c_str(), -1, SQLITE_TRANSIENT );
    }

    void bindCycle( sqlite3_stmt* stmt, const ForecastCycle& cycle )
    {
        bindText( stmt, 1, cycle.date );
        bindText( stmt, 2, cycle.cycle );
    }

    std :: string columnText( sqlite3_stmt* stmt, int column )
    {
        const unsigned char* text = sqlite3_column_text( stmt, column );
        return text ? std :: string( reinterpret_cast<const char*>( text ) ) : std :: string();
    }

    // step to completion; anything other than SQLITE_DONE is a read failure
    void finishRead( sqlite3* db, int rc )
    {
        if( rc != SQLITE_DONE )
            throw PipelineError( Errors :: FAIL_READ + sqlite3_errmsg( db ) );
    }

    std :: vector<ForecastSample> readSamples( sqlite3* db, sqlite3_stmt* stmt )
    {
        std :: vector<ForecastSample> samples;

        int rc;
        while( ( rc = sqlite3_step( stmt ) ) == SQLITE_ROW )
        {
            ForecastSample sample;
            sample.forecastDate     =   columnText( stmt, 0 );
            sample.cycle            =   columnText( stmt, 1 );
            sample.lat              =   sqlite3_column_double( stmt, 2 );
            sample.lon              =   sqlite3_column_double( stmt, 3 );
            sample.forecastHour     =   sqlite3_column_int( stmt, 4 );

            if( sqlite3_column_type( stmt, 5 ) != SQLITE_NULL )
                sample.windPowerDensity = sqlite3_column_double( stmt, 5 );

            samples.push_back( std :: move( sample ) );
        }
        finishRead( db, rc );

        return samples;
    }

    std :: vector<std :: string> readStrings( sqlite3* db, sqlite3_stmt* stmt )
    {
        std :: vector<std :: string> values;

        int rc;
        while( ( rc = sqlite3_step( stmt ) ) == SQLITE_ROW )
        {
            values.push_back( columnText( stmt, 0 ) );
        }
        finishRead( db, rc );

        return values;
    }

    /*!
        BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless
        commit() ran. IMMEDIATE takes the write lock up front so a second
        writer waits on the busy timeout instead of failing mid-transaction.
    */
    class Transaction
    {
        public:
            explicit Transaction( sqlite3* db ) : db_( db )
            {
                run( "BEGIN IMMEDIATE" );
            }

            ~Transaction()
            {
                if( committed_ )
                    return;

                char* err = nullptr;
                if( sqlite3_exec( db_, "ROLLBACK", nullptr, nullptr, &err ) != SQLITE_OK )
                {
                    CROW_LOG_ERROR << Errors :: FAIL_TXN << ( err ? err : "ROLLBACK" );
                    sqlite3_free( err );
                }
            }

            Transaction( const Transaction& )               =   delete;
            Transaction& operator=( const Transaction& )    =   delete;

            void commit()
            {
                run( "COMMIT" );
                committed_ = true;
            }

        private:
            sqlite3*    db_;
            bool        committed_  =   false;

            void run( const char* sql )
            {
                char* err = nullptr;
                if( sqlite3_exec( db_, sql, nullptr, nullptr, &err ) != SQLITE_OK )
                {
                    std :: string message = Errors :: FAIL_TXN + sql + ": " + ( err ? err : "unknown" );
                    sqlite3_free( err );
                    throw WriteFailure( message );
                }
            }
    };
}

ForecastStore :: ForecastStore( const std :: string& path, Mode mode ) : path_( path ),
                                                                         db_( nullptr )
{
    int flags = mode == Mode :: ReadOnly
                ? SQLITE_OPEN_READONLY
                : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    if( sqlite3_open_v2( path.c_str(), &db_, flags, nullptr ) != SQLITE_OK )
    {
        std :: string message = Errors :: FAIL_O_DB + path + ": " + ( db_ ? sqlite3_errmsg( db_ ) : "out of memory" );
        sqlite3_close( db_ );
        db_ = nullptr;

        if( mode == Mode :: ReadOnly )
            throw PipelineError( message );
        throw WriteFailure( message );
    }

    // wait for a competing writer instead of failing with SQLITE_BUSY
    sqlite3_busy_timeout( db_, 5000 );

    if( mode == Mode :: ReadWrite )
    {
        try
        {
            createSchema();
        }
        catch( const std :: exception& )
        {
            sqlite3_close( db_ );
            db_ = nullptr;
            throw;
        }
    }

    CROW_LOG_DEBUG << "Opened forecast store " << path
                   << ( mode == Mode :: ReadOnly ? " (read-only)" : "" );
}

ForecastStore :: ~ForecastStore()
{
    if( db_ )
        sqlite3_close( db_ );
}

void ForecastStore :: createSchema()
{
    const char* statements[] =
    {
        "PRAGMA journal_mode=WAL;",
        kCreateForecasts,
        kCreateRankings,
        kForecastsKey,
        kRankingsKey
    };

    for( const char* sql : statements )
    {
        char* err = nullptr;
        if( sqlite3_exec( db_, sql, nullptr, nullptr, &err ) != SQLITE_OK )
        {
            std :: string message = Errors :: FAIL_SCHEMA + ( err ? err : sqlite3_errmsg( db_ ) );
            sqlite3_free( err );
            throw WriteFailure( message );
        }
    }
}


/*++++++++++++++*
|  write path   |
*+++++++++++++++*/

/*!
    Upsert a batch of samples in one transaction. Either every row of the
    batch lands or none does.
*/
void ForecastStore :: upsertSamples( const std :: vector<ForecastSample>& samples )
{
    if( samples.empty() )
        return;

    Transaction txn( db_ );
    auto stmt = prepare<WriteFailure>( db_, kUpsertSample );

    for( const auto& sample : samples )
    {
        sqlite3_reset( stmt.get() );
        sqlite3_clear_bindings( stmt.get() );

        bindText( stmt.get(), 1, sample.forecastDate );
        bindText( stmt.get(), 2, sample.cycle );
        sqlite3_bind_double( stmt.get(), 3, sample.lat );
        sqlite3_bind_double( stmt.get(), 4, sample.lon );
        sqlite3_bind_int( stmt.get(), 5, sample.forecastHour );

        if( sample.windPowerDensity )
            sqlite3_bind_double( stmt.get(), 6, *sample.windPowerDensity );
        else
            sqlite3_bind_null( stmt.get(), 6 );

        if( sqlite3_step( stmt.get() ) != SQLITE_DONE )
            throw WriteFailure( Errors :: FAIL_INSERT + sqlite3_errmsg( db_ ) );
    }

    txn.commit();
}

/*!
    Delete every ranking of the cycle and insert the new set in the same
    transaction. On any failure the transaction rolls back and the previous
    complete set stays in place.
*/
void ForecastStore :: replaceRankings( const ForecastCycle& cycle,
                                       const std :: vector<CountryRanking>& rankings )
{
    Transaction txn( db_ );

    auto remove = prepare<WriteFailure>( db_, kDeleteRankings );
    bindCycle( remove.get(), cycle );
    if( sqlite3_step( remove.get() ) != SQLITE_DONE )
        throw WriteFailure( Errors :: FAIL_REPLACE + sqlite3_errmsg( db_ ) );

    auto insert = prepare<WriteFailure>( db_, kInsertRanking );
    for( const auto& ranking : rankings )
    {
        sqlite3_reset( insert.get() );
        sqlite3_clear_bindings( insert.get() );

        bindCycle( insert.get(), cycle );
        bindText( insert.get(), 3, ranking.country );
        sqlite3_bind_double( insert.get(), 4, ranking.avgWindPowerDensity );
        sqlite3_bind_int( insert.get(), 5, ranking.rank );

        if( sqlite3_step( insert.get() ) != SQLITE_DONE )
            throw WriteFailure( Errors :: FAIL_REPLACE + sqlite3_errmsg( db_ ) );
    }

    txn.commit();
}


/*++++++++++++++*
|  read path    |
*+++++++++++++++*/

std :: vector<ForecastSample> ForecastStore :: loadSamples( const ForecastCycle& cycle ) const
{
    auto stmt = prepare<PipelineError>( db_, kSelectSamples );
    bindCycle( stmt.get(), cycle );
    return readSamples( db_, stmt.get() );
}

std :: vector<ForecastSample> ForecastStore :: loadSamples( const ForecastCycle& cycle, int forecastHour ) const
{
    auto stmt = prepare<PipelineError>( db_, kSelectHourSamples );
    bindCycle( stmt.get(), cycle );
    sqlite3_bind_int( stmt.get(), 3, forecastHour );
    return readSamples( db_, stmt.get() );
}

std :: size_t ForecastStore :: countSamples( const ForecastCycle& cycle ) const
{
    auto stmt = prepare<PipelineError>( db_, kCountSamples );
    bindCycle( stmt.get(), cycle );

    if( sqlite3_step( stmt.get() ) != SQLITE_ROW )
        throw PipelineError( Errors :: FAIL_READ + sqlite3_errmsg( db_ ) );

    return static_cast<std :: size_t>( sqlite3_column_int64( stmt.get(), 0 ) );
}

std :: vector<CountryRanking> ForecastStore :: loadRankings( const ForecastCycle& cycle ) const
{
    auto stmt = prepare<PipelineError>( db_, kSelectRankings );
    bindCycle( stmt.get(), cycle );

    std :: vector<CountryRanking> rankings;

    int rc;
    while( ( rc = sqlite3_step( stmt.get() ) ) == SQLITE_ROW )
    {
        CountryRanking ranking;
        ranking.forecastDate        =   columnText( stmt.get(), 0 );
        ranking.cycle               =   columnText( stmt.get(), 1 );
        ranking.country             =   columnText( stmt.get(), 2 );
        ranking.avgWindPowerDensity =   sqlite3_column_double( stmt.get(), 3 );
        ranking.rank                =   sqlite3_column_int( stmt.get(), 4 );
        rankings.push_back( std :: move( ranking ) );
    }
    finishRead( db_, rc );

    return rankings;
}

std :: vector<std :: string> ForecastStore :: listDates() const
{
    auto stmt = prepare<PipelineError>( db_, kSelectDates );
    return readStrings( db_, stmt.get() );
}

std :: vector<std :: string> ForecastStore :: listCycles( const std :: string& date ) const
{
    auto stmt = prepare<PipelineError>( db_, kSelectCycles );
    bindText( stmt.get(), 1, date );
    return readStrings( db_, stmt.get() );
}

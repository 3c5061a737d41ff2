#ifndef SPATIAL_EXTRACT_H
#define SPATIAL_EXTRACT_H

#include "country_boundaries.h"
#include "forecast_cycle.h"
#include "forecast_store.h"
#include "raster_snapshot.h"

#include <string>
#include <vector>

// axis-aligned box in degrees
struct CellBox
{
    double  west    =   0.0;
    double  south   =   0.0;
    double  east    =   0.0;
    double  north   =   0.0;

    double area() const
    {
        return ( east - west ) * ( north - south );
    }
};

struct CountryMean
{
    std :: string   country;
    std :: string   isoCode;
    double          mean        =   0.0;
    double          coverage    =   0.0;   // sum of cell coverage fractions
};

// shoelace area of a ring, always >= 0
double                          ringArea            ( const Ring& ring );

// area of ring inside box, Sutherland-Hodgman clip against the four edges
double                          clippedRingArea     ( const Ring& ring, const CellBox& box );

// fraction of box covered by the country, holes removed, clamped to [ 0, 1 ]
double                          coverageFraction    ( const CountryPolygon& country, const CellBox& box );

/*!
    Overlap-weighted mean of the raster over each country: every defined cell
    contributes value * ( fraction of the cell inside the country ). Countries
    touching no defined cell are left out of the result rather than given a
    placeholder. Output keeps the input country order.
*/
std :: vector<CountryMean>      extractCountryMeans ( const RasterSnapshot& raster,
                                                      const std :: vector<CountryPolygon>& countries );

/*!
    Sort by descending mean and number 1..N. The sort is stable, so equal
    means keep the order extractCountryMeans produced them in.
*/
std :: vector<CountryRanking>   rankCountries       ( std :: vector<CountryMean> means,
                                                      const ForecastCycle& cycle );

#endif

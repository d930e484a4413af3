/*==============================================================================
CSV to Time Series

This defines a small utility function to read a forecast time series
consisting of rows with two columns: One for the time in hours since the
start of the horizon and one for the value of the forecast quantity at that
time. The rows are separated by commas, and lines starting with a hash are
comments. The CSV parser is Ben Strasser's fast C++ CSV Reader class [1].

The samples are returned as a map sorted on time, and two rows with the same
time stamp is an error since the value at that time would be ambiguous.

References:
[1] https://github.com/ben-strasser/fast-cpp-csv-parser

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_CSV_TIME_SERIES
#define HEMS_CSV_TIME_SERIES

#include <map>                    // Time to value map
#include <string>                 // File names

namespace HEMS
{
  using ForecastSamples = std::map< double, double >;

  extern ForecastSamples CSVtoTimeSeries( const std::string & FileName );
}      // name space HEMS
#endif // HEMS_CSV_TIME_SERIES

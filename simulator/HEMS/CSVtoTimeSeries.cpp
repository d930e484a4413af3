/*==============================================================================
CSV to Time Series

This is the implementation of the utility function to read a forecast time
series consisting of rows with two columns: One for the time stamp in hours
and one for the value. The CSV parser is Ben Strasser's fast C++ CSV Reader
class [1].

References:
[1] https://github.com/ben-strasser/fast-cpp-csv-parser

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#include <string>                  // Standard strings
#include <map>                     // The time series map
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include <boost/log/trivial.hpp>   // Diagnostic messages

#include "CSVtoTimeSeries.hpp"     // Function signature
#include "csv.h"                   // The CSV parser

HEMS::ForecastSamples HEMS::CSVtoTimeSeries( const std::string & FileName )
{
  ForecastSamples TimeSeries;        // The time series to return
  double          TimeStamp,         // To store read time stamp
                  Value;             // To store the read value

  // Parse two columns from the file, using comma as separator and ignoring
  // spaces and tabs around the values. Empty lines and lines starting with
  // a hash are skipped.

  io::CSVReader< 2, io::trim_chars< ' ', '\t' >, io::no_quote_escape< ',' >,
                 io::throw_on_overflow, io::single_and_empty_line_comment< '#' > >
      CSVParser( FileName );

  // The files have no column headers and they are just defined.

  CSVParser.set_header( "Time", "Value" );

  while ( CSVParser.read_row( TimeStamp, Value ) )
    if ( !TimeSeries.emplace( TimeStamp, Value ).second )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "CSV Read error: File \"" << FileName << "\" has "
                   << "more than one value at time " << TimeStamp;

      throw std::invalid_argument( ErrorMessage.str() );
    }

  //  It could be that the CSV file did not contain any valid data and in
  //  that case the time series will not be valid.

  if ( TimeSeries.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "CSV Read error: File \"" << FileName
                 << "\" does not contain any data";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  BOOST_LOG_TRIVIAL( debug ) << "Read " << TimeSeries.size()
                             << " samples from " << FileName;

  return TimeSeries;
}

#ifndef _SEISRESP_RESP_FILE_H_
#define _SEISRESP_RESP_FILE_H_
#include <string>
#include <vector>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/algorithms/ComplexArray.h"
#include "seisresp/response/PAZ.h"
namespace seisresp::response{
/*! \brief Error thrown by the RESP evaluator.

An unreadable source and a source from which evalresp returns no
response (no matching epoch or content it cannot parse) are thrown as
Invalid.  A response evalresp returns that does not cover the requested
frequency grid is thrown as Fatal. */
class RespFileError : public seisresp::utility::SeisRespError
{
public:
  RespFileError(const std::string mess,
      const seisresp::utility::ErrorSeverity s=seisresp::utility::ErrorSeverity::Invalid)
    : seisresp::utility::SeisRespError(std::string("RespFileError:  ")+mess,s){};
};

/*! Units of ground motion a response can be expressed in. */
enum class RespUnits
{
  DIS,
  VEL,
  ACC
};
/*! Convert DIS, VEL, or ACC (case insensitive) to the enum.
\exception RespFileError for anything else. */
RespUnits string2units(const std::string s);
std::string units2string(const RespUnits u);

/*! \brief Date with day of year resolution as used in SEED headers. */
class RespDate
{
public:
  RespDate() : year(1970),doy(1){};
  RespDate(const int yr, const int jday);
  /*! Parse YYYY,DDD optionally followed by ,HH:MM:SS which is ignored.
  \exception RespFileError if the string cannot be parsed. */
  RespDate(const std::string s);
  int get_year() const {return year;};
  int get_doy() const {return doy;};
  bool operator<(const RespDate& other) const
  {
    if(year!=other.year) return year<other.year;
    return doy<other.doy;
  };
  bool operator<=(const RespDate& other) const
  {
    return !(other<(*this));
  };
  bool operator==(const RespDate& other) const
  {
    return (year==other.year) && (doy==other.doy);
  };
  std::string str() const;
private:
  int year;
  int doy;
};

/*! \brief Identifies which calibration epoch of a RESP source to use.

The source is either a file name or the text of a RESP file.  If
content is not empty it is used and filename is ignored.  station,
channel, network, and locid accept * as a wildcard. */
class RespDescriptor
{
public:
  RespDescriptor();
  std::string filename;
  std::string content;
  RespDate date;
  std::string station;
  std::string channel;
  std::string network;
  std::string locid;
  RespUnits units;
};

/*! \brief Evaluate a RESP calibration on an fft frequency grid.

The response is computed by the evalresp library.  The source text is
copied to a temporary file with its line endings normalized because
evalresp reads only from files.  The temporary file is removed on every
exit path.

Frequencies are k*fy/n for k=0..n with n=nfft/2 and fy=1/(2*delta).
The returned response is the complex conjugate of the evalresp
response in the units requested by the descriptor with the imaginary
part of the Nyquist sample set to 0.  No partial result is ever
returned.

\exception RespFileError if the source cannot be read, evalresp returns
  no response for the descriptor, or the returned response is unusable.
*/
FrequencyResponse evaluate_resp(const double delta, const int nfft,
    const RespDescriptor& desc);
}
#endif

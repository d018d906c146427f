#ifndef _SEISRESP_ERROR_H_
#define _SEISRESP_ERROR_H_
#include <iostream>
#include <exception>
#include <string>
namespace seisresp::utility {
/*! \brief Severity code attached to every error and log entry.

Ordered from most to least serious. */
enum class ErrorSeverity
{
  Fatal,
  Invalid,
  Suspect,
  Complaint,
  Debug,
  Informational
};

/*! Convert a keyword (e.g. "Complaint") to an ErrorSeverity.  Unknown
keywords return Fatal.*/
ErrorSeverity string2severity(const std::string howbad);
/*! Inverse of string2severity*/
std::string severity2string(const ErrorSeverity es);

/*! \brief Exception thrown by all seisresp library routines.

Configuration errors (bad parameters, incomplete descriptors, empty
input) are thrown as Invalid.  Failures reading or parsing a RESP
source are Invalid when the source is missing and Fatal when it is
corrupt.  what() returns the message with ":" and the severity keyword
appended.
**/
class SeisRespError : public std::exception
{
public:
  SeisRespError() : SeisRespError("seisresp library error",ErrorSeverity::Fatal)
  {
  };
  /*! Normal form.  s defaults to Invalid. */
  SeisRespError(const std::string mess,
      const ErrorSeverity s=ErrorSeverity::Invalid)
    : message(mess),badness(s),
      full_message(mess + ":" + severity2string(s))
  {
  };
  SeisRespError(const char *mess,const ErrorSeverity s)
    : SeisRespError(std::string(mess),s)
  {
  };
  /*! Severity given as a keyword.  See string2severity. */
  SeisRespError(const std::string mess,const char *howbad)
    : SeisRespError(mess,string2severity(std::string(howbad)))
  {
  };
  /*! Write the raw message to ofs (default stderr). */
  void log_error(std::ostream& ofs=std::cerr) const
  {
    ofs << message << std::endl;
  };
  const char * what() const noexcept{return full_message.c_str();};
  ErrorSeverity severity() const {return badness;};
  /*! Message without the severity keyword. */
  std::string core_message() const {return message;};
protected:
  std::string message;
  ErrorSeverity badness;
  std::string full_message;
};
/*! True if err is Fatal or Invalid, meaning any result is unusable. */
bool error_says_data_bad(const SeisRespError& err);

/*! \brief Recover the severity keyword from the what string.

Returns "Invalid" if no keyword follows the last colon.
*/
std::string parse_message_error_severity(const SeisRespError& err);
ErrorSeverity message_error_severity(const SeisRespError& err);
}
#endif

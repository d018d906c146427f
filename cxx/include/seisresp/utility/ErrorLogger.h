#ifndef _SEISRESP_ERROR_LOGGER_H_
#define _SEISRESP_ERROR_LOGGER_H_
#include <unistd.h>
#include <list>
#include <string>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/library_version_type.hpp>
#include <boost/serialization/list.hpp>
#include <boost/serialization/string.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include "seisresp/utility/SeisRespError.h"
namespace seisresp::utility{
/*! One entry of an ErrorLogger. */
class LogData
{
public:
  int job_id;
  /*! getpid() of the process that posted the entry */
  int p_id;
  std::string algorithm;
  ErrorSeverity badness;
  std::string message;
  LogData() : job_id(0),p_id(0),badness(ErrorSeverity::Informational){};
  /*! Take message and severity from an exception.  message is the
  what() string so it carries the severity keyword. */
  LogData(const int jid, const std::string alg,const SeisRespError& merr);
  LogData(const int jid, const std::string alg, const std::string msg,
      const ErrorSeverity lvl);
  friend std::ostream& operator<<(std::ostream&, const LogData&);
private:
  friend boost::serialization::access;
  template<class Archive>
     void serialize(Archive& ar,const unsigned int version)
  {
    ar & job_id & p_id & algorithm & badness & message;
  };
};
/*! \brief Container to hold a processing log.

Instrument correction does not stop for anything less than a
configuration or resource error.  Everything else the engine wants a
caller to know about (transform length used, number of spectral bins
clamped by the water level, descriptors that were ignored) is posted
here.  A caller that wants the record passes one of these to the
processing method and inspects it afterward.  */
class ErrorLogger
{
public:
  ErrorLogger(const int job=0) : job_id(job){};
  ErrorLogger(const ErrorLogger& parent);
  ErrorLogger& operator=(const ErrorLogger& parent);
  void set_job_id(int jid){job_id=jid;};
  int get_job_id() const {return job_id;};
  /*! Post an exception.  algorithm is set to "SeisRespError".
  Returns the log size after insertion. */
  int log_error(const SeisRespError& merr);
  /*! Post a message from algorithm alg.  Returns the log size after
  insertion. */
  int log_error(const std::string alg, const std::string mess,
      const ErrorSeverity level=ErrorSeverity::Invalid);
  /*! Same as log_error with Informational severity. */
  int log_verbose(const std::string alg, const std::string mess);
  std::list<LogData> get_error_log()const{return allmessages;};
  int size()const{return allmessages.size();};
  /*! Append the contents of another log to this one. */
  ErrorLogger& operator+=(const ErrorLogger& other);
  /*! \brief Return all entries at the most serious level present.

  Empty if the log is empty. */
  std::list<LogData> worst_errors()const;
private:
  int job_id;
  std::list<LogData> allmessages;
  friend boost::serialization::access;
  template<class Archive>
     void serialize(Archive& ar,const unsigned int version)
  {
    ar & job_id & allmessages;
  };
};
}
#endif

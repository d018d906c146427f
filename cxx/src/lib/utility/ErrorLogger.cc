#include "seisresp/utility/ErrorLogger.h"
namespace seisresp::utility
{
using namespace std;

LogData::LogData(const int jid, const string alg, const SeisRespError& merr)
  : job_id(jid),p_id(getpid()),algorithm(alg),badness(merr.severity()),
    message(merr.what())
{
}
LogData::LogData(const int jid, const string alg, const string msg,
    const ErrorSeverity lvl)
  : job_id(jid),p_id(getpid()),algorithm(alg),badness(lvl),message(msg)
{
}
ostream& operator<<(ostream& ofs, const LogData& ld)
{
  ofs<<severity2string(ld.badness)<<" "<<ld.job_id<<" "<<ld.p_id<<" "
    <<ld.algorithm<<" "<<ld.message<<endl;
  return ofs;
}
ErrorLogger::ErrorLogger(const ErrorLogger& parent)
  : job_id(parent.job_id),allmessages(parent.allmessages)
{
}
ErrorLogger& ErrorLogger::operator=(const ErrorLogger& parent)
{
  if(this!=&parent)
  {
    job_id=parent.job_id;
    allmessages=parent.allmessages;
  }
  return *this;
}
ErrorLogger& ErrorLogger::operator+=(const ErrorLogger& other)
{
  /* Copy first so appending a log to itself is safe */
  list<LogData> tail(other.allmessages);
  allmessages.splice(allmessages.end(),tail);
  return *this;
}
int ErrorLogger::log_error(const SeisRespError& merr)
{
  allmessages.push_back(LogData(job_id,string("SeisRespError"),merr));
  return allmessages.size();
}
int ErrorLogger::log_error(const string alg, const string mess,
  const ErrorSeverity level)
{
  allmessages.push_back(LogData(job_id,alg,mess,level));
  return allmessages.size();
}
int ErrorLogger::log_verbose(const string alg, const string mess)
{
  return this->log_error(alg,mess,ErrorSeverity::Informational);
}
namespace {
/* 0 is worst.  Anything unrecognized ranks with Informational. */
int severity_rank(const ErrorSeverity es)
{
  switch(es)
  {
    case ErrorSeverity::Fatal:
      return 0;
    case ErrorSeverity::Invalid:
      return 1;
    case ErrorSeverity::Suspect:
      return 2;
    case ErrorSeverity::Complaint:
      return 3;
    case ErrorSeverity::Debug:
      return 4;
    default:
      return 5;
  };
}
}
list<LogData> ErrorLogger::worst_errors() const
{
  list<LogData> result;
  int worst(6);
  for(auto aptr=allmessages.begin();aptr!=allmessages.end();++aptr)
  {
    int r=severity_rank(aptr->badness);
    if(r<worst)
    {
      result.clear();
      worst=r;
    }
    if(r==worst) result.push_back(*aptr);
  }
  return result;
}
}

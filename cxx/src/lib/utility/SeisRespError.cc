#include <string>
#include "seisresp/utility/SeisRespError.h"
namespace seisresp::utility {
using namespace std;
namespace {
/* Keyword for each severity in enum order */
const int nseverity(6);
const ErrorSeverity severity_codes[nseverity]={ErrorSeverity::Fatal,
  ErrorSeverity::Invalid,ErrorSeverity::Suspect,ErrorSeverity::Complaint,
  ErrorSeverity::Debug,ErrorSeverity::Informational};
const char *severity_names[nseverity]={"Fatal","Invalid","Suspect",
  "Complaint","Debug","Informational"};
}
/* Unrecognized keywords map to Fatal so a typo is never mistaken for
something harmless */
ErrorSeverity string2severity(const string howbad)
{
  for(int i=0;i<nseverity;++i)
    if(howbad==severity_names[i]) return severity_codes[i];
  return ErrorSeverity::Fatal;
}
string severity2string(const ErrorSeverity es)
{
  for(int i=0;i<nseverity;++i)
    if(es==severity_codes[i]) return string(severity_names[i]);
  return string("Fatal");
}
string parse_message_error_severity(const SeisRespError& err)
{
  const string s(err.what());
  size_t colon=s.rfind(':');
  if(colon==string::npos || colon+1==s.size()) return string("Invalid");
  return s.substr(colon+1);
}
ErrorSeverity message_error_severity(const SeisRespError& err)
{
  return string2severity(parse_message_error_severity(err));
}
bool error_says_data_bad(const SeisRespError& err)
{
  ErrorSeverity es=err.severity();
  return es==ErrorSeverity::Fatal || es==ErrorSeverity::Invalid;
}
}

#include <ctype.h>
#include <unistd.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>
#include "seisresp/response/RespFile.h"
extern "C" {
#include <evresp.h>
}
namespace seisresp::response
{
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;

RespUnits string2units(const string s)
{
  string us;
  for(size_t i=0;i<s.size();++i) us.push_back(toupper(s[i]));
  if(us=="DIS") return RespUnits::DIS;
  if(us=="VEL") return RespUnits::VEL;
  if(us=="ACC") return RespUnits::ACC;
  throw RespFileError("illegal units="+s+" - must be DIS, VEL, or ACC");
}
string units2string(const RespUnits u)
{
  switch(u)
  {
    case RespUnits::DIS:
      return string("DIS");
    case RespUnits::ACC:
      return string("ACC");
    case RespUnits::VEL:
    default:
      return string("VEL");
  };
}
RespDate::RespDate(const int yr, const int jday)
{
  if(jday<1 || jday>366)
  {
    stringstream ss;
    ss<<"RespDate constructor:  illegal day of year="<<jday;
    throw RespFileError(ss.str());
  }
  year=yr;
  doy=jday;
}
RespDate::RespDate(const string s)
{
  /* Format is YYYY,DDD or YYYY,DDD,HH:MM:SS */
  size_t comma=s.find(',');
  if(comma==string::npos)
    throw RespFileError("cannot parse date string="+s+" - expected YYYY,DDD");
  char *endptr;
  string sy=s.substr(0,comma);
  year=static_cast<int>(strtol(sy.c_str(),&endptr,10));
  if(sy.empty() || *endptr!='\0')
    throw RespFileError("cannot parse year in date string="+s);
  string sd=s.substr(comma+1);
  size_t comma2=sd.find(',');
  if(comma2!=string::npos) sd.erase(comma2);
  const char *dstart=sd.c_str();
  while(*dstart==' ') ++dstart;
  doy=static_cast<int>(strtol(dstart,&endptr,10));
  while(*endptr==' ') ++endptr;
  if(*dstart=='\0' || *endptr!='\0')
    throw RespFileError("cannot parse day of year in date string="+s);
  if(doy<1 || doy>366)
    throw RespFileError("illegal day of year in date string="+s);
}
string RespDate::str() const
{
  char buf[32];
  snprintf(buf,32,"%04d,%03d",year,doy);
  return string(buf);
}
RespDescriptor::RespDescriptor() : station("*"),channel("*"),network("*"),
  locid("*"),units(RespUnits::VEL)
{
}

namespace {
/* Owns the response list evresp allocates */
struct ResponseListDeleter
{
  void operator()(struct ::response *r) const
  {
    if(r!=NULL) ::free_response(r);
  };
};
typedef std::unique_ptr<struct ::response,ResponseListDeleter> ResponseList;

/* RESP text written to a private temporary file that is removed when
this object goes out of scope. */
class TempRespFile
{
public:
  TempRespFile(const string& text)
  {
    const char *tmpdir=getenv("TMPDIR");
    string pattern=string(tmpdir==NULL ? "/tmp" : tmpdir)+"/seisrespXXXXXX";
    vector<char> buf(pattern.begin(),pattern.end());
    buf.push_back('\0');
    int fd=mkstemp(buf.data());
    if(fd<0)
      throw RespFileError("cannot create temporary file for RESP content from template="
          +pattern,ErrorSeverity::Fatal);
    fname=string(buf.data());
    size_t nwritten(0);
    while(nwritten<text.size())
    {
      ssize_t n=write(fd,text.data()+nwritten,text.size()-nwritten);
      if(n<=0)
      {
        close(fd);
        unlink(fname.c_str());
        throw RespFileError("write failed for temporary RESP file="+fname,
            ErrorSeverity::Fatal);
      }
      nwritten+=n;
    }
    close(fd);
  };
  ~TempRespFile()
  {
    unlink(fname.c_str());
  };
  TempRespFile(const TempRespFile&)=delete;
  TempRespFile& operator=(const TempRespFile&)=delete;
  const string& name() const {return fname;};
private:
  string fname;
};
/* Text of the RESP source in the descriptor */
string resp_source_text(const RespDescriptor& desc)
{
  if(!desc.content.empty()) return desc.content;
  ifstream ifs(desc.filename.c_str(),ios::in|ios::binary);
  if(!ifs.good())
    throw RespFileError("cannot open RESP file="+desc.filename);
  stringstream ss;
  ss<<ifs.rdbuf();
  if(ifs.bad())
    throw RespFileError("read failed for RESP file="+desc.filename);
  return ss.str();
}
/* Rejoin text with \n line endings whatever the source used */
string normalize_line_endings(const string& text)
{
  string result;
  result.reserve(text.size()+1);
  for(size_t i=0;i<text.size();++i)
  {
    if(text[i]=='\r')
    {
      result.push_back('\n');
      if(i+1<text.size() && text[i+1]=='\n') ++i;
    }
    else
      result.push_back(text[i]);
  }
  if(result.empty() || result.back()!='\n') result.push_back('\n');
  return result;
}
/* evresp takes writable C strings */
vector<char> cstring(const string& s)
{
  vector<char> result(s.begin(),s.end());
  result.push_back('\0');
  return result;
}
}

FrequencyResponse evaluate_resp(const double delta, const int nfft,
    const RespDescriptor& desc)
{
  if(delta<=0.0 || nfft<2)
  {
    stringstream ss;
    ss<<"evaluate_resp:  illegal sample interval="<<delta
      <<" or fft length="<<nfft;
    throw RespFileError(ss.str());
  }
  const int n=nfft/2;
  const double fy=1.0/(2.0*delta);
  FrequencyResponse result;
  result.f.reserve(n+1);
  for(int k=0;k<=n;++k)
    result.f.push_back(fy*static_cast<double>(k)/static_cast<double>(n));
  TempRespFile tmpfile(normalize_line_endings(resp_source_text(desc)));
  vector<char> sta=cstring(desc.station);
  vector<char> cha=cstring(desc.channel);
  vector<char> net=cstring(desc.network);
  vector<char> loc=cstring(desc.locid);
  vector<char> datime=cstring(desc.date.str());
  vector<char> units=cstring(units2string(desc.units));
  vector<char> fname=cstring(tmpfile.name());
  vector<char> rtype=cstring("CS");
  vector<char> verbose=cstring("");
  vector<double> freqs(result.f);
  /* All stages, no total sensitivity override, RESP rather than XML input */
  ResponseList rlist(::evresp(sta.data(),cha.data(),net.data(),loc.data(),
      datime.data(),units.data(),fname.data(),freqs.data(),n+1,
      rtype.data(),verbose.data(),-1,0,0,0,0.0,0));
  const string id=desc.network+"."+desc.station+"."+desc.locid+"."
    +desc.channel+" for date "+desc.date.str();
  if(!rlist)
  {
    string source=desc.content.empty() ? "file="+desc.filename
      : string("RESP content");
    throw RespFileError("evalresp returned no response for "+id
        +" from "+source+" (no matching epoch or unparsable RESP)");
  }
  const struct ::response *r=rlist.get();
  if(r->nfreqs!=n+1 || r->rvec==NULL)
  {
    stringstream ss;
    ss<<"evalresp returned "<<r->nfreqs<<" frequencies for "<<id
      <<" but "<<n+1<<" were requested";
    throw RespFileError(ss.str(),ErrorSeverity::Fatal);
  }
  result.h=ComplexArray(n+1);
  for(int k=0;k<=n;++k)
  {
    double re=r->rvec[k].real;
    double im=r->rvec[k].imag;
    if(!std::isfinite(re) || !std::isfinite(im))
    {
      stringstream ss;
      ss<<"evalresp response for "<<id<<" is not finite at frequency "
        <<result.f[k]<<" Hz";
      throw RespFileError(ss.str(),ErrorSeverity::Fatal);
    }
    /* Stored conjugated with a real Nyquist sample */
    result.h.set(k,Complex64(re,k==n ? 0.0 : -im));
  }
  return result;
}
}

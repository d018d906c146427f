#include <math.h>
#include <list>
#include <string>
#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/response/PAZ.h"
namespace seisresp::response
{
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;

PAZ::PAZ() : a0(1.0),sens(1.0),sensitivity_is_set(false)
{
}
PAZ::PAZ(const vector<Complex64>& poles, const vector<Complex64>& zeros,
    const double gain) : p(poles),z(zeros),a0(gain),sens(1.0),
      sensitivity_is_set(false)
{
  if(gain<=0.0)
  {
    stringstream ss;
    ss<<"PAZ constructor:  illegal gain="<<gain<<" - must be positive";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
}
PAZ::PAZ(const vector<Complex64>& poles, const vector<Complex64>& zeros,
    const double gain, const double sensitivity) : PAZ(poles,zeros,gain)
{
  this->set_sensitivity(sensitivity);
}
namespace {
/* Parses a pf Tbl of roots.  Each line is a real and imaginary part. */
vector<Complex64> parse_roots(const AntelopePf& pf, const string key)
{
  if(!pf.has_tbl(key))
    throw SeisRespError(string("PAZ parameter file constructor:  ")
        + "required Tbl with key="+key+" is missing",ErrorSeverity::Invalid);
  list<string> lines=pf.get_tbl(key);
  vector<Complex64> result;
  for(auto lptr=lines.begin();lptr!=lines.end();++lptr)
  {
    istringstream is(*lptr);
    double re,im(0.0);
    is>>re;
    if(is.fail())
      throw SeisRespError(string("PAZ parameter file constructor:  ")
        + "cannot parse this line of Tbl "+key+"->"+(*lptr),
        ErrorSeverity::Invalid);
    if(!(is>>im)) im=0.0;
    result.push_back(Complex64(re,im));
  }
  return result;
}
}
PAZ::PAZ(const AntelopePf& pf) : sens(1.0),sensitivity_is_set(false)
{
  const string base_error("PAZ parameter file constructor:  ");
  if(!pf.is_defined("gain"))
    throw SeisRespError(base_error+"required key=gain is missing",
        ErrorSeverity::Invalid);
  p=parse_roots(pf,"poles");
  z=parse_roots(pf,"zeros");
  a0=pf.get_double("gain");
  if(a0<=0.0)
  {
    stringstream ss;
    ss<<base_error<<"illegal gain="<<a0<<" - must be positive";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  if(pf.is_defined("sensitivity"))
    this->set_sensitivity(pf.get_double("sensitivity"));
}
PAZ::PAZ(const PAZ& parent) : p(parent.p),z(parent.z),a0(parent.a0),
  sens(parent.sens),sensitivity_is_set(parent.sensitivity_is_set)
{
}
PAZ& PAZ::operator=(const PAZ& parent)
{
  if(this!=&parent)
  {
    p=parent.p;
    z=parent.z;
    a0=parent.a0;
    sens=parent.sens;
    sensitivity_is_set=parent.sensitivity_is_set;
  }
  return *this;
}
double PAZ::sensitivity() const
{
  if(!sensitivity_is_set)
    throw SeisRespError("PAZ::sensitivity:  no sensitivity is defined for this instrument",
        ErrorSeverity::Invalid);
  return sens;
}
void PAZ::set_sensitivity(const double s)
{
  if(s<=0.0)
  {
    stringstream ss;
    ss<<"PAZ::set_sensitivity:  illegal sensitivity="<<s<<" - must be positive";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  sens=s;
  sensitivity_is_set=true;
}

vector<Complex64> poly(const vector<Complex64>& roots)
{
  vector<Complex64> c(1,Complex64(1.0,0.0));
  for(auto rptr=roots.begin();rptr!=roots.end();++rptr)
  {
    /* multiply current polynomial by (x - root) */
    vector<Complex64> next(c.size()+1,Complex64(0.0,0.0));
    for(size_t i=0;i<c.size();++i)
    {
      next[i] += c[i];
      next[i+1] -= c[i]*(*rptr);
    }
    c=next;
  }
  return c;
}
Complex64 polyval(const vector<Complex64>& c, const Complex64 x)
{
  Complex64 result(0.0,0.0);
  for(auto cptr=c.begin();cptr!=c.end();++cptr)
    result = result*x + (*cptr);
  return result;
}
FrequencyResponse paz_to_freq_response(const vector<Complex64>& poles,
    const vector<Complex64>& zeros, const double gain, const double delta,
    const int nfft)
{
  const string base_error("paz_to_freq_response:  ");
  if(delta<=0.0)
  {
    stringstream ss;
    ss<<base_error<<"illegal sample interval="<<delta;
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  if(nfft<2)
  {
    stringstream ss;
    ss<<base_error<<"illegal fft length="<<nfft;
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  int n=nfft/2;
  double fy=1.0/(2.0*delta);
  vector<Complex64> b=poly(zeros);
  for(auto bptr=b.begin();bptr!=b.end();++bptr) (*bptr) *= gain;
  vector<Complex64> a=poly(poles);
  FrequencyResponse result;
  result.h=ComplexArray(n+1);
  result.f.reserve(n+1);
  for(int k=0;k<=n;++k)
  {
    double f=fy*static_cast<double>(k)/static_cast<double>(n);
    Complex64 s(0.0,2.0*M_PI*f);
    Complex64 h=polyval(b,s)/polyval(a,s);
    result.h.set(k,std::conj(h));
    result.f.push_back(f);
  }
  return result;
}
FrequencyResponse paz_to_freq_response(const PAZ& paz, const double delta,
    const int nfft)
{
  return paz_to_freq_response(paz.poles(),paz.zeros(),paz.gain(),delta,nfft);
}
double paz_amplitude_at(const PAZ& paz, const double freq)
{
  Complex64 jw(0.0,2.0*M_PI*freq);
  Complex64 h(paz.gain(),0.0);
  for(auto zptr=paz.zeros().begin();zptr!=paz.zeros().end();++zptr)
    h *= (jw-(*zptr));
  for(auto pptr=paz.poles().begin();pptr!=paz.poles().end();++pptr)
    h /= (jw-(*pptr));
  return std::abs(h);
}
PAZ corner_freq_to_paz(const double fc, const double damping)
{
  if(fc<=0.0 || damping<=0.0 || damping>1.0)
  {
    stringstream ss;
    ss<<"corner_freq_to_paz:  illegal input.  fc="<<fc
      <<" damping="<<damping<<endl
      <<"fc must be positive and damping must be in (0,1]";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  double w0=2.0*M_PI*fc;
  double wd=sqrt(1.0-damping*damping);
  vector<Complex64> poles;
  poles.push_back(-Complex64(damping,wd)*w0);
  poles.push_back(-Complex64(damping,-wd)*w0);
  vector<Complex64> zeros(2,Complex64(0.0,0.0));
  return PAZ(poles,zeros,1.0,1.0);
}
/* The second pole is real.  Local magnitude calibrations in use were
derived with this form so it is retained. */
PAZ WoodAndersonPAZ()
{
  vector<Complex64> poles;
  poles.push_back(Complex64(-6.283,4.7124));
  poles.push_back(Complex64(-6.283-4.7124,0.0));
  vector<Complex64> zeros(1,Complex64(0.0,0.0));
  return PAZ(poles,zeros,1.0,2080.0);
}
}

#include <math.h>
#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/algorithms/magnitude.h"
namespace seisresp::algorithms
{
using namespace std;
using namespace seisresp::utility;
using seisresp::response::PAZ;

double wood_anderson_amplitude(const PAZ& paz, const double amplitude,
    const double timespan)
{
  if(timespan<=0.0)
  {
    stringstream ss;
    ss<<"wood_anderson_amplitude:  illegal timespan="<<timespan
      <<" - must be positive";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  const PAZ wa=seisresp::response::WoodAndersonPAZ();
  double freq=1.0/(2.0*timespan);
  double a=amplitude/2.0;
  a /= (seisresp::response::paz_amplitude_at(paz,freq)*paz.sensitivity());
  a *= (seisresp::response::paz_amplitude_at(wa,freq)*wa.sensitivity());
  /* m to mm */
  return a*1000.0;
}
namespace {
double ml_from_amplitude(const double a, const double d)
{
  return log10(a) + log10(d/100.0) + 0.00301*(d-100.0) + 3.0;
}
}
double local_magnitude(const PAZ& paz, const double amplitude,
    const double timespan, const double hypocentral_distance)
{
  double a=wood_anderson_amplitude(paz,amplitude,timespan);
  return ml_from_amplitude(a,hypocentral_distance);
}
double local_magnitude(const vector<PAZ>& paz, const vector<double>& amplitude,
    const vector<double>& timespan, const double hypocentral_distance)
{
  if(paz.empty() || paz.size()!=amplitude.size() || paz.size()!=timespan.size())
  {
    stringstream ss;
    ss<<"local_magnitude:  inconsistent reading lists"<<endl
      <<"Number of instruments="<<paz.size()
      <<", number of amplitudes="<<amplitude.size()
      <<", number of timespans="<<timespan.size()<<endl
      <<"Lists must be the same nonzero length"<<endl;
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  double sum(0.0);
  for(size_t i=0;i<paz.size();++i)
    sum += wood_anderson_amplitude(paz[i],amplitude[i],timespan[i]);
  double avg=sum/static_cast<double>(paz.size());
  return ml_from_amplitude(avg,hypocentral_distance);
}
}

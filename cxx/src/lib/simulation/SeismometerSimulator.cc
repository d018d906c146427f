#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/algorithms/FFTEngine.h"
#include "seisresp/algorithms/Taper.h"
#include "seisresp/algorithms/WaterLevel.h"
#include "seisresp/algorithms/algorithms.h"
#include "seisresp/response/PAZ.h"
#include "seisresp/response/RespFile.h"
#include "seisresp/simulation/SeismometerSimulator.h"
namespace seisresp::simulation
{
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;
using namespace seisresp::response;

const string algname("SeismometerSimulator");

SeismometerSimulator::SeismometerSimulator(const SimulationOptions& opts)
  : options(opts)
{
}
SeismometerSimulator::SeismometerSimulator(const AntelopePf& pf)
  : options(pf)
{
}
SeismometerSimulator::SeismometerSimulator(const SeismometerSimulator& parent)
  : options(parent.options)
{
}
SeismometerSimulator& SeismometerSimulator::operator=(const SeismometerSimulator& parent)
{
  if(this!=&parent)
  {
    options=parent.options;
  }
  return *this;
}
void SeismometerSimulator::validate(const vector<double>& data,
    const double samp_rate, const InstrumentResponses& resp) const
{
  const string base_error("SeismometerSimulator::apply:  ");
  if(resp.empty())
    throw SeisRespError(base_error
        +"no instrument to remove or simulate and no RESP descriptor was given",
        ErrorSeverity::Invalid);
  if(data.empty())
    throw SeisRespError(base_error+"input data vector is empty",
        ErrorSeverity::Invalid);
  if(samp_rate<=0.0)
  {
    stringstream ss;
    ss<<base_error<<"illegal sample rate="<<samp_rate
      <<" - must be positive";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  if(resp.has_remove() && options.get_remove_sensitivity()
        && !resp.get_remove().has_sensitivity())
    throw SeisRespError(base_error
        +"remove_sensitivity is set but the instrument to remove has no sensitivity",
        ErrorSeverity::Invalid);
  if(resp.has_simulate() && options.get_simulate_sensitivity()
        && !resp.get_simulate().has_sensitivity())
    throw SeisRespError(base_error
        +"simulate_sensitivity is set but the instrument to simulate has no sensitivity",
        ErrorSeverity::Invalid);
}
vector<double> SeismometerSimulator::apply(const vector<double>& data,
    const double samp_rate, const InstrumentResponses& resp) const
{
  /* Notes go to a scratch log that is discarded */
  ErrorLogger scratch;
  return this->apply(data,samp_rate,resp,scratch);
}
vector<double> SeismometerSimulator::apply(const vector<double>& data,
    const double samp_rate, const InstrumentResponses& resp,
    ErrorLogger& elog) const
{
  this->validate(data,samp_rate,resp);
  const double delta=1.0/samp_rate;
  const int ndat=data.size();
  vector<double> d;
  if(options.get_zero_mean())
    d=detrend_mean(data);
  else
    d=data;
  if(options.get_taper())
  {
    vector<double> w=cosine_taper(ndat,options.get_taper_fraction());
    for(int i=0;i<ndat;++i) d[i]*=w[i];
  }
  int nfft=ComputeFFTLength(ndat,options.get_nfft_pow2());
  FFTEngine fft(nfft);
  ComplexArray spec=fft.rfft(d);
  int nclamped(0);
  if(resp.has_remove() || resp.has_seedresp())
  {
    FrequencyResponse h;
    if(resp.has_seedresp())
    {
      if(resp.has_remove())
        elog.log_error(algname,
          "both a RESP descriptor and poles and zeros to remove were given; using the RESP response",
          ErrorSeverity::Complaint);
      h=evaluate_resp(delta,nfft,resp.get_seedresp());
    }
    else
    {
      h=paz_to_freq_response(resp.get_remove(),delta,nfft);
    }
    if(options.has_pre_filter())
    {
      const PreFilter& pf=options.get_pre_filter();
      double fny=0.5*samp_rate;
      if(pf.get_f4()>fny)
      {
        stringstream ss;
        ss<<"pre-filter upper corner f4="<<pf.get_f4()
          <<" exceeds the Nyquist frequency="<<fny;
        elog.log_error(algname,ss.str(),ErrorSeverity::Complaint);
      }
      pf.apply(spec,h.f);
    }
    nclamped=invert_with_water_level(h.h,options.get_water_level());
    h.h.conj();
    spec *= h.h;
  }
  else if(options.has_pre_filter())
  {
    elog.log_error(algname,
      "pre-filter ignored because no instrument response is being removed",
      ErrorSeverity::Complaint);
  }
  if(resp.has_simulate())
  {
    FrequencyResponse hsim=paz_to_freq_response(resp.get_simulate(),delta,nfft);
    hsim.h.conj();
    spec *= hsim.h;
  }
  vector<double> result=fft.irfft(spec);
  result.resize(ndat);
  result=detrend_linear(result);
  /* The RESP response already includes the overall sensitivity */
  double scale(1.0);
  if(resp.has_remove() && options.get_remove_sensitivity())
    scale /= resp.get_remove().sensitivity();
  if(resp.has_simulate() && options.get_simulate_sensitivity())
    scale *= resp.get_simulate().sensitivity();
  if(scale!=1.0)
    for(int i=0;i<ndat;++i) result[i]*=scale;
  stringstream ss;
  ss<<"nfft="<<nfft<<" water level clamped "<<nclamped
    <<" of "<<spec.size()<<" frequencies";
  elog.log_verbose(algname,ss.str());
  return result;
}
}

#include <sstream>
#include <list>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/simulation/SimulationOptions.h"
namespace seisresp::simulation
{
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;

SimulationOptions::SimulationOptions()
  : remove_sensitivity(true),simulate_sensitivity(true),water_level(600.0),
    zero_mean(true),taper(true),taper_fraction(0.05),nfft_pow2(false),
    use_pre_filter(false)
{
}
SimulationOptions::SimulationOptions(const AntelopePf& pf) : SimulationOptions()
{
  const string base_error("SimulationOptions parameter file constructor:  ");
  if(pf.is_defined("remove_sensitivity"))
    remove_sensitivity=pf.get_bool("remove_sensitivity");
  if(pf.is_defined("simulate_sensitivity"))
    simulate_sensitivity=pf.get_bool("simulate_sensitivity");
  if(pf.is_defined("water_level"))
    water_level=pf.get_double("water_level");
  if(pf.is_defined("zero_mean"))
    zero_mean=pf.get_bool("zero_mean");
  if(pf.is_defined("taper"))
    taper=pf.get_bool("taper");
  if(pf.is_defined("taper_fraction"))
    this->set_taper_fraction(pf.get_double("taper_fraction"));
  if(pf.is_defined("nfft_pow2"))
    nfft_pow2=pf.get_bool("nfft_pow2");
  if(pf.has_tbl("pre_filter"))
  {
    list<string> t=pf.get_tbl("pre_filter");
    /* Corners may be on one line or spread over several */
    stringstream ss;
    for(auto lptr=t.begin();lptr!=t.end();++lptr) ss<<(*lptr)<<" ";
    double f[4];
    for(int i=0;i<4;++i)
    {
      ss>>f[i];
      if(ss.fail())
        throw SeisRespError(base_error
            +"pre_filter Tbl must contain four corner frequencies f1 f2 f3 f4",
            ErrorSeverity::Invalid);
    }
    this->set_pre_filter(PreFilter(f[0],f[1],f[2],f[3]));
  }
}
SimulationOptions::SimulationOptions(const SimulationOptions& parent)
  : remove_sensitivity(parent.remove_sensitivity),
    simulate_sensitivity(parent.simulate_sensitivity),
    water_level(parent.water_level),
    zero_mean(parent.zero_mean),
    taper(parent.taper),
    taper_fraction(parent.taper_fraction),
    nfft_pow2(parent.nfft_pow2),
    use_pre_filter(parent.use_pre_filter),
    pre_filter(parent.pre_filter)
{
}
SimulationOptions& SimulationOptions::operator=(const SimulationOptions& parent)
{
  if(this!=&parent)
  {
    remove_sensitivity=parent.remove_sensitivity;
    simulate_sensitivity=parent.simulate_sensitivity;
    water_level=parent.water_level;
    zero_mean=parent.zero_mean;
    taper=parent.taper;
    taper_fraction=parent.taper_fraction;
    nfft_pow2=parent.nfft_pow2;
    use_pre_filter=parent.use_pre_filter;
    pre_filter=parent.pre_filter;
  }
  return *this;
}
void SimulationOptions::set_taper_fraction(const double fraction)
{
  if(fraction<0.0 || fraction>1.0)
  {
    stringstream ss;
    ss<<"SimulationOptions::set_taper_fraction:  illegal value="<<fraction
      <<" - must be in the range 0 to 1";
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  taper_fraction=fraction;
}
}

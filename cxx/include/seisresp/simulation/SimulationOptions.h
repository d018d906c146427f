#ifndef _SEISRESP_SIMULATION_OPTIONS_H_
#define _SEISRESP_SIMULATION_OPTIONS_H_
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/serialization/serialization.hpp>
#include "seisresp/utility/AntelopePf.h"
#include "seisresp/algorithms/Taper.h"
namespace seisresp::simulation{
/*! \brief Processing parameters of the seismometer simulation engine.

Defaults:  divide by the removed instrument sensitivity, multiply by the
simulated instrument sensitivity, 600 dB water level, remove the mean,
5% cosine taper, no pre-filter, and a transform length that is not
forced to a power of 2.
*/
class SimulationOptions
{
public:
  SimulationOptions();
  /*! \brief Construct from a parameter file.

  Recognized keys are remove_sensitivity, simulate_sensitivity,
  water_level, zero_mean, taper, taper_fraction, nfft_pow2, and a
  pre_filter Tbl with one line holding the four corner frequencies.
  Keys that are not present keep their defaults.

  \exception SeisRespError with Invalid severity if a value is illegal.
  */
  SimulationOptions(const seisresp::utility::AntelopePf& pf);
  SimulationOptions(const SimulationOptions& parent);
  SimulationOptions& operator=(const SimulationOptions& parent);
  bool get_remove_sensitivity() const {return remove_sensitivity;};
  bool get_simulate_sensitivity() const {return simulate_sensitivity;};
  double get_water_level() const {return water_level;};
  bool get_zero_mean() const {return zero_mean;};
  bool get_taper() const {return taper;};
  double get_taper_fraction() const {return taper_fraction;};
  bool get_nfft_pow2() const {return nfft_pow2;};
  bool has_pre_filter() const {return use_pre_filter;};
  const seisresp::algorithms::PreFilter& get_pre_filter() const {return pre_filter;};
  void set_remove_sensitivity(const bool b){remove_sensitivity=b;};
  void set_simulate_sensitivity(const bool b){simulate_sensitivity=b;};
  void set_water_level(const double wl){water_level=wl;};
  void set_zero_mean(const bool b){zero_mean=b;};
  void set_taper(const bool b){taper=b;};
  /*! \exception SeisRespError if fraction is outside [0,1]. */
  void set_taper_fraction(const double fraction);
  void set_nfft_pow2(const bool b){nfft_pow2=b;};
  void set_pre_filter(const seisresp::algorithms::PreFilter& pf)
  {
    pre_filter=pf;
    use_pre_filter=true;
  };
  void clear_pre_filter(){use_pre_filter=false;};
private:
  bool remove_sensitivity;
  bool simulate_sensitivity;
  double water_level;
  bool zero_mean;
  bool taper;
  double taper_fraction;
  bool nfft_pow2;
  bool use_pre_filter;
  seisresp::algorithms::PreFilter pre_filter;
  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive & ar, const unsigned int version)
  {
    ar & remove_sensitivity;
    ar & simulate_sensitivity;
    ar & water_level;
    ar & zero_mean;
    ar & taper;
    ar & taper_fraction;
    ar & nfft_pow2;
    ar & use_pre_filter;
    ar & pre_filter;
  };
};
}
#endif

#ifndef _SEISRESP_PAZ_H_
#define _SEISRESP_PAZ_H_
#include <vector>
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/complex.hpp>
#include "seisresp/utility/AntelopePf.h"
#include "seisresp/algorithms/ComplexArray.h"
namespace seisresp::response{
/*! \brief Poles-zeros-gain description of an analog instrument.

Defines the Laplace domain transfer function
  H(s) = gain * prod(s-zero) / prod(s-pole)
with s in rad/s.  The convention is the usual one where correction
yields ground velocity in m/s.  The sensitivity (overall counts per
unit ground motion) is optional and is only needed when the simulation
engine is asked to scale by it.  Pole and zero lists may be empty.
*/
class PAZ
{
public:
  /*! Default constructor.  Empty lists, unit gain, no sensitivity. */
  PAZ();
  /*! Construct without a sensitivity.

  \exception SeisRespError if gain is not positive. */
  PAZ(const std::vector<seisresp::algorithms::Complex64>& poles,
      const std::vector<seisresp::algorithms::Complex64>& zeros,
      const double gain);
  /*! Construct with a sensitivity.

  \exception SeisRespError if gain or sensitivity are not positive. */
  PAZ(const std::vector<seisresp::algorithms::Complex64>& poles,
      const std::vector<seisresp::algorithms::Complex64>& zeros,
      const double gain, const double sensitivity);
  /*! \brief Construct from a parameter file branch.

  The branch must contain a gain value and poles and zeros Tbls.  Each
  Tbl line holds the real and imaginary part of one root.  A missing
  imaginary part is taken as 0.  A sensitivity value is optional.

  \exception SeisRespError with Invalid severity naming the key if
    gain, poles, or zeros is missing, or if a Tbl line cannot be parsed.
  */
  PAZ(const seisresp::utility::AntelopePf& pf);
  PAZ(const PAZ& parent);
  PAZ& operator=(const PAZ& parent);
  const std::vector<seisresp::algorithms::Complex64>& poles() const {return p;};
  const std::vector<seisresp::algorithms::Complex64>& zeros() const {return z;};
  double gain() const {return a0;};
  bool has_sensitivity() const {return sensitivity_is_set;};
  /*! Return the sensitivity.
  \exception SeisRespError if no sensitivity was defined. */
  double sensitivity() const;
  void set_sensitivity(const double s);
private:
  std::vector<seisresp::algorithms::Complex64> p;
  std::vector<seisresp::algorithms::Complex64> z;
  double a0;
  double sens;
  bool sensitivity_is_set;
  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive & ar, const unsigned int version)
  {
    ar & p;
    ar & z;
    ar & a0;
    ar & sens;
    ar & sensitivity_is_set;
  };
};
/*! \brief Complex response sampled on a uniform frequency grid.

f[0] is 0 and f[n] is the Nyquist frequency.  h and f have the same
size, nfft/2+1. */
typedef struct FrequencyResponse
{
  seisresp::algorithms::ComplexArray h;
  std::vector<double> f;
} FrequencyResponse;

/*! \brief Convert roots to polynomial coefficients.

Returns the coefficients of prod(x-root) in descending powers of x.
An empty list returns the constant polynomial 1. */
std::vector<seisresp::algorithms::Complex64> poly(
    const std::vector<seisresp::algorithms::Complex64>& roots);
/*! Evaluate a polynomial with coefficients in descending powers at x. */
seisresp::algorithms::Complex64 polyval(
    const std::vector<seisresp::algorithms::Complex64>& c,
    const seisresp::algorithms::Complex64 x);
/*! \brief Analog frequency response of a poles and zeros description.

The zero-pole-gain form is converted to numerator and denominator
polynomials.  Their ratio is evaluated at s=j*2*pi*f for nfft/2+1
frequencies evenly spaced from 0 to Nyquist (1/(2*delta)).  The result
is the complex conjugate of that analog response.  The simulation
engine applies a second conjugate when it uses the response.

\param poles is the list of poles (rad/s).
\param zeros is the list of zeros (rad/s).
\param gain is the normalization factor.
\param delta is the sample interval in s.
\param nfft is the transform length.

\exception SeisRespError if delta is not positive or nfft is less than 2.
*/
FrequencyResponse paz_to_freq_response(
    const std::vector<seisresp::algorithms::Complex64>& poles,
    const std::vector<seisresp::algorithms::Complex64>& zeros,
    const double gain, const double delta, const int nfft);
/*! Overload taking a PAZ object.  The sensitivity is not used. */
FrequencyResponse paz_to_freq_response(const PAZ& paz, const double delta,
    const int nfft);
/*! Return |H(j*2*pi*freq)| for paz.  The sensitivity is not used. */
double paz_amplitude_at(const PAZ& paz, const double freq);
/*! \brief Damped oscillator for a corner frequency.

Returns two poles -(damping +/- j*sqrt(1-damping^2))*2*pi*fc, two zeros
at the origin, gain 1, and sensitivity 1.

\exception SeisRespError if fc is not positive or damping is not in (0,1].
*/
PAZ corner_freq_to_paz(const double fc, const double damping=0.707);
/*! Standard Wood-Anderson torsion seismometer used by local magnitude
scales.  Sensitivity is 2080. */
PAZ WoodAndersonPAZ();
}
#endif

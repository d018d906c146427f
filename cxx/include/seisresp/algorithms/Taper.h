#ifndef _SEISRESP_TAPER_H_
#define _SEISRESP_TAPER_H_
#include <vector>
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/serialization/serialization.hpp>
#include "seisresp/algorithms/ComplexArray.h"

namespace seisresp::algorithms{
/*! \brief Return a cosine taper window of length npts.

The window is 1 except for a raised cosine ramp at each end.  fraction
is the total fraction of the window that is tapered split evenly between
the two ends.  The number of samples in each ramp is
floor(npts*fraction/2), plus one unless fraction is exactly 0 or 1, and
never more than npts/2.  The head ramp is 0.5*(1+cos(theta)) with theta
evenly spaced from pi to 2pi.  The tail ramp is the mirror image of the
head so the window is symmetric.

fraction=0 returns all ones.  fraction=1 returns a full cosine bell.

\param npts is the window length.
\param fraction is the fraction of the window tapered (0 to 1).

\exception SeisRespError if fraction is outside [0,1].
*/
std::vector<double> cosine_taper(const int npts, const double fraction);

/*! \brief Frequency domain band limiting window applied before deconvolution.

Four corner frequencies f1<=f2<=f3<=f4 define a trapezoid with cosine
ramps.  The window is 0 below f1 and above f4, 1 between f2 and f3,
and has a half cosine ramp from 0 to 1 between f1 and f2 and from 1
to 0 between f3 and f4.  Equal corners define a step. */
class PreFilter
{
public:
  /*! Default defines a window that passes everything. */
  PreFilter();
  /*! Primary constructor.

  \exception SeisRespError if any corner is negative or the corners
    are not ordered f1<=f2<=f3<=f4. */
  PreFilter(const double f1, const double f2, const double f3, const double f4);
  PreFilter(const PreFilter& parent);
  PreFilter& operator=(const PreFilter& parent);
  /*! Return the window value at one frequency (Hz). */
  double weight(const double f) const;
  /*! Return the window values for a vector of frequencies. */
  std::vector<double> window(const std::vector<double>& freqs) const;
  /*! Multiply a spectrum sampled at freqs by the window. */
  void apply(ComplexArray& spec, const std::vector<double>& freqs) const;
  double get_f1() const {return f1;};
  double get_f2() const {return f2;};
  double get_f3() const {return f3;};
  double get_f4() const {return f4;};
private:
  double f1,f2,f3,f4;
  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive & ar, const unsigned int version)
  {
    ar & f1;
    ar & f2;
    ar & f3;
    ar & f4;
  };
};
}
#endif

#ifndef _SEISRESP_ALGORITHMS_H_
#define _SEISRESP_ALGORITHMS_H_
#include <vector>
namespace seisresp::algorithms{
/*! Return a copy of d with the mean removed. */
std::vector<double> detrend_mean(const std::vector<double>& d);
/*! \brief Return a copy of d with a linear trend removed.

The trend is the straight line through the first and last sample, not
a least squares fit.  Both end samples of the result are therefore 0.
A single sample input returns a single 0. */
std::vector<double> detrend_linear(const std::vector<double>& d);
}
#endif

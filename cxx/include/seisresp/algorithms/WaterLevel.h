#ifndef _SEISRESP_WATER_LEVEL_H_
#define _SEISRESP_WATER_LEVEL_H_
#include "seisresp/algorithms/ComplexArray.h"
namespace seisresp::algorithms{
/*! \brief Return the absolute amplitude threshold for a water level.

The threshold is max|spec| scaled down by water_level_db decibels,
max|spec|*10^(-water_level_db/20). */
double water_level_amplitude(const ComplexArray& spec, const double water_level_db);
/*! \brief Invert a spectrum in place regularized by a water level.

Every bin with a nonzero amplitude below the threshold computed by
water_level_amplitude is scaled up to the threshold without changing
its phase.  Every bin with nonzero amplitude is then replaced by its
complex reciprocal.  Bins with zero amplitude are set to 0+0j and are
never inverted.

\param spec is the spectrum to be inverted.  It is altered.
\param water_level_db is the water level in decibels below the peak.

\return number of bins raised to the water level.
*/
int invert_with_water_level(ComplexArray& spec, const double water_level_db);
}
#endif

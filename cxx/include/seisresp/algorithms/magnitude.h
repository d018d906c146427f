#ifndef _SEISRESP_MAGNITUDE_H_
#define _SEISRESP_MAGNITUDE_H_
#include <vector>
#include "seisresp/response/PAZ.h"
namespace seisresp::algorithms{
/*! \brief Wood-Anderson equivalent amplitude of one reading.

The reading is a peak to peak amplitude in counts measured over a half
period timespan.  The dominant frequency is 1/(2*timespan).  Half the
peak to peak amplitude is divided by the instrument amplitude response
at that frequency times its sensitivity, then multiplied by the
Wood-Anderson amplitude response and sensitivity at the same frequency.

\param paz is the recording instrument.  It must carry a sensitivity.
\param amplitude is the peak to peak amplitude in counts.
\param timespan is the time between the two peaks in s.

\return Wood-Anderson equivalent amplitude in mm.

\exception SeisRespError if timespan is not positive or paz has no
  sensitivity.
*/
double wood_anderson_amplitude(const seisresp::response::PAZ& paz,
    const double amplitude, const double timespan);
/*! \brief Local magnitude from a single reading.

Uses the Bakun and Joyner (1984) distance correction,
  ml = log10(a) + log10(d/100) + 0.00301*(d-100) + 3.0
where a is the Wood-Anderson equivalent amplitude in mm and d the
hypocentral distance in km.
*/
double local_magnitude(const seisresp::response::PAZ& paz,
    const double amplitude, const double timespan,
    const double hypocentral_distance);
/*! \brief Local magnitude from multiple readings.

The Wood-Anderson equivalent amplitudes of all readings (e.g. the two
horizontal components) are averaged before the magnitude formula is
applied.

\exception SeisRespError if the three lists are empty or have
  different lengths.
*/
double local_magnitude(const std::vector<seisresp::response::PAZ>& paz,
    const std::vector<double>& amplitude, const std::vector<double>& timespan,
    const double hypocentral_distance);
}
#endif

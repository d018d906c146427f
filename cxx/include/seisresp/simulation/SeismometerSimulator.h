#ifndef _SEISRESP_SEISMOMETER_SIMULATOR_H_
#define _SEISRESP_SEISMOMETER_SIMULATOR_H_
#include <vector>
#include "seisresp/utility/AntelopePf.h"
#include "seisresp/utility/ErrorLogger.h"
#include "seisresp/simulation/SimulationOptions.h"
#include "seisresp/simulation/InstrumentResponses.h"
namespace seisresp::simulation{
/*! \brief Frequency domain instrument correction and simulation.

This object removes the response of one instrument from a trace and/or
convolves the trace with the response of another.  The algorithm is the
classic one used by seismic analysis packages like PITSA and SAC:

1.  The mean is removed and the data are cosine tapered (both optional).
2.  Data are zero padded to at least twice their length and transformed.
3.  If an instrument is to be removed its response is computed on the
    fft frequency grid, either from poles and zeros or from a RESP file.
    The optional pre-filter window is applied to the data spectrum.  The
    response is inverted with a water level and multiplied into the data.
4.  If an instrument is to be simulated its response is multiplied into
    the data.
5.  The result is transformed back, truncated to the input length, and
    linearly detrended.
6.  The output is divided by the sensitivity of the removed poles and
    zeros instrument and multiplied by the sensitivity of the simulated
    instrument when these corrections are enabled.

The object holds only processing parameters.  apply never changes
its arguments and can be called concurrently on different data.
*/
class SeismometerSimulator
{
public:
  /*! Construct with default options. */
  SeismometerSimulator(){};
  SeismometerSimulator(const SimulationOptions& opts);
  /*! Construct reading options from a parameter file.  See
  SimulationOptions for the keys recognized. */
  SeismometerSimulator(const seisresp::utility::AntelopePf& pf);
  SeismometerSimulator(const SeismometerSimulator& parent);
  SeismometerSimulator& operator=(const SeismometerSimulator& parent);
  const SimulationOptions& get_options() const {return options;};
  void changeparameter(const SimulationOptions& opts){options=opts;};
  /*! \brief Correct a trace.

  \param data is the input trace.
  \param samp_rate is the sample rate in Hz.
  \param resp defines the instruments to remove and/or simulate.

  \return corrected trace with the same number of samples as data.

  \exception SeisRespError with Invalid severity if data is empty,
    samp_rate is not positive, resp is empty, or a sensitivity
    correction is requested for an instrument with no sensitivity.
    Errors from the RESP reader are propagated unaltered.
  */
  std::vector<double> apply(const std::vector<double>& data,
      const double samp_rate, const InstrumentResponses& resp) const;
  /*! \brief Correct a trace posting processing notes to a log.

  Same as the simpler overload but the transform length and count of
  water level clamped frequencies are posted as Informational entries.
  Conflicting or suspicious input that does not prevent processing is
  posted with Complaint severity.
  */
  std::vector<double> apply(const std::vector<double>& data,
      const double samp_rate, const InstrumentResponses& resp,
      seisresp::utility::ErrorLogger& elog) const;
private:
  SimulationOptions options;
  void validate(const std::vector<double>& data, const double samp_rate,
      const InstrumentResponses& resp) const;
};
}
#endif

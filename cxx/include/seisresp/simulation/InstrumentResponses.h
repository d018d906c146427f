#ifndef _SEISRESP_INSTRUMENT_RESPONSES_H_
#define _SEISRESP_INSTRUMENT_RESPONSES_H_
#include "seisresp/utility/AntelopePf.h"
#include "seisresp/response/PAZ.h"
#include "seisresp/response/RespFile.h"
namespace seisresp::simulation{
/*! \brief Instrument descriptions handed to the simulation engine.

Holds up to three optional descriptors:  the poles and zeros of the
instrument to be removed, the poles and zeros of the instrument to be
simulated, and a RESP descriptor for the instrument to be removed.
Any combination is allowed, but the engine requires at least one of
them.  The getters throw if the requested descriptor was never set, so
callers should test with the has_ methods first.
*/
class InstrumentResponses
{
public:
  InstrumentResponses();
  /*! \brief Construct from a parameter file.

  Looks for the branches paz_remove, paz_simulate, and seedresp.  Any of
  them may be absent.  A paz branch must define gain, poles, and zeros.
  A seedresp branch must define either filename or content and a date
  written as YYYY,DDD.  station, channel, network, and locid default to
  * and units defaults to VEL.

  \exception SeisRespError with Invalid severity if a branch is
    incomplete.
  */
  InstrumentResponses(const seisresp::utility::AntelopePf& pf);
  InstrumentResponses(const InstrumentResponses& parent);
  InstrumentResponses& operator=(const InstrumentResponses& parent);
  void set_remove(const seisresp::response::PAZ& paz);
  void set_simulate(const seisresp::response::PAZ& paz);
  void set_seedresp(const seisresp::response::RespDescriptor& desc);
  bool has_remove() const {return remove_is_set;};
  bool has_simulate() const {return simulate_is_set;};
  bool has_seedresp() const {return seedresp_is_set;};
  /*! True if no descriptor is defined. */
  bool empty() const
  {
    return !(remove_is_set || simulate_is_set || seedresp_is_set);
  };
  const seisresp::response::PAZ& get_remove() const;
  const seisresp::response::PAZ& get_simulate() const;
  const seisresp::response::RespDescriptor& get_seedresp() const;
  /*! Unset all descriptors. */
  void clear();
private:
  seisresp::response::PAZ paz_remove;
  seisresp::response::PAZ paz_simulate;
  seisresp::response::RespDescriptor seedresp;
  bool remove_is_set;
  bool simulate_is_set;
  bool seedresp_is_set;
};
/*! \brief Build a RESP descriptor from a parameter file branch.

\exception SeisRespError if neither filename nor content is defined or
  the date is missing or malformed.
*/
seisresp::response::RespDescriptor RespDescriptorFromPf(
    const seisresp::utility::AntelopePf& pf);
}
#endif

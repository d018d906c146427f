#include <list>
#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/simulation/InstrumentResponses.h"
namespace seisresp::simulation
{
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::response;

InstrumentResponses::InstrumentResponses() : remove_is_set(false),
  simulate_is_set(false),seedresp_is_set(false)
{
}
InstrumentResponses::InstrumentResponses(const AntelopePf& pf)
  : InstrumentResponses()
{
  if(pf.has_branch("paz_remove"))
  {
    paz_remove=PAZ(pf.get_branch("paz_remove"));
    remove_is_set=true;
  }
  if(pf.has_branch("paz_simulate"))
  {
    paz_simulate=PAZ(pf.get_branch("paz_simulate"));
    simulate_is_set=true;
  }
  if(pf.has_branch("seedresp"))
  {
    seedresp=RespDescriptorFromPf(pf.get_branch("seedresp"));
    seedresp_is_set=true;
  }
}
InstrumentResponses::InstrumentResponses(const InstrumentResponses& parent)
  : paz_remove(parent.paz_remove),paz_simulate(parent.paz_simulate),
    seedresp(parent.seedresp),remove_is_set(parent.remove_is_set),
    simulate_is_set(parent.simulate_is_set),
    seedresp_is_set(parent.seedresp_is_set)
{
}
InstrumentResponses& InstrumentResponses::operator=(const InstrumentResponses& parent)
{
  if(this!=&parent)
  {
    paz_remove=parent.paz_remove;
    paz_simulate=parent.paz_simulate;
    seedresp=parent.seedresp;
    remove_is_set=parent.remove_is_set;
    simulate_is_set=parent.simulate_is_set;
    seedresp_is_set=parent.seedresp_is_set;
  }
  return *this;
}
void InstrumentResponses::set_remove(const PAZ& paz)
{
  paz_remove=paz;
  remove_is_set=true;
}
void InstrumentResponses::set_simulate(const PAZ& paz)
{
  paz_simulate=paz;
  simulate_is_set=true;
}
void InstrumentResponses::set_seedresp(const RespDescriptor& desc)
{
  seedresp=desc;
  seedresp_is_set=true;
}
const PAZ& InstrumentResponses::get_remove() const
{
  if(!remove_is_set)
    throw SeisRespError("InstrumentResponses::get_remove:  no instrument to remove was defined",
        ErrorSeverity::Invalid);
  return paz_remove;
}
const PAZ& InstrumentResponses::get_simulate() const
{
  if(!simulate_is_set)
    throw SeisRespError("InstrumentResponses::get_simulate:  no instrument to simulate was defined",
        ErrorSeverity::Invalid);
  return paz_simulate;
}
const RespDescriptor& InstrumentResponses::get_seedresp() const
{
  if(!seedresp_is_set)
    throw SeisRespError("InstrumentResponses::get_seedresp:  no RESP descriptor was defined",
        ErrorSeverity::Invalid);
  return seedresp;
}
void InstrumentResponses::clear()
{
  paz_remove=PAZ();
  paz_simulate=PAZ();
  seedresp=RespDescriptor();
  remove_is_set=false;
  simulate_is_set=false;
  seedresp_is_set=false;
}

RespDescriptor RespDescriptorFromPf(const AntelopePf& pf)
{
  const string base_error("RespDescriptorFromPf:  ");
  RespDescriptor desc;
  /* content is a Tbl holding the text of a RESP file one line per entry */
  if(pf.has_tbl("content"))
  {
    list<string> t=pf.get_tbl("content");
    stringstream ss;
    for(auto lptr=t.begin();lptr!=t.end();++lptr) ss<<(*lptr)<<endl;
    desc.content=ss.str();
  }
  else if(pf.is_defined("filename"))
  {
    desc.filename=pf.get_string("filename");
  }
  else
  {
    throw SeisRespError(base_error
        +"seedresp branch must define filename or a content Tbl",
        ErrorSeverity::Invalid);
  }
  if(!pf.is_defined("date"))
    throw SeisRespError(base_error+"required key date is missing",
        ErrorSeverity::Invalid);
  desc.date=RespDate(pf.get_string("date"));
  if(pf.is_defined("station")) desc.station=pf.get_string("station");
  if(pf.is_defined("channel")) desc.channel=pf.get_string("channel");
  if(pf.is_defined("network")) desc.network=pf.get_string("network");
  if(pf.is_defined("locid")) desc.locid=pf.get_string("locid");
  if(pf.is_defined("units")) desc.units=string2units(pf.get_string("units"));
  return desc;
}
}

#include <iostream>
#include <fstream>
#include <sstream>
#include <cassert>
#include <math.h>
#include <list>
#include <string>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/utility/ErrorLogger.h"
#include "seisresp/utility/Metadata.h"
#include "seisresp/utility/AntelopePf.h"
#include "seisresp/response/PAZ.h"
#include "seisresp/response/RespFile.h"
#include "seisresp/simulation/SimulationOptions.h"
#include "seisresp/simulation/InstrumentResponses.h"
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;
using namespace seisresp::response;
using namespace seisresp::simulation;
/* Test program for configuration and logging components */
const string pftext(
"# Parameters for instrument correction\n"
"water_level 60.0\n"
"taper_fraction 0.1\n"
"nfft_pow2 true\n"
"remove_sensitivity no\n"
"pre_filter &Tbl{\n"
"0.005 0.006 30.0 35.0\n"
"}\n"
"paz_remove &Arr{\n"
"gain 0.4\n"
"sensitivity 1500.0\n"
"poles &Tbl{\n"
"-4.44 4.44\n"
"-4.44 -4.44\n"
"}\n"
"zeros &Tbl{\n"
"0.0 0.0\n"
"0.0\n"
"}\n"
"}\n"
"seedresp &Arr{\n"
"filename RESP.IU.ANMO.00.BHZ\n"
"date 2010,001\n"
"station ANMO\n"
"channel BHZ\n"
"network IU\n"
"locid 00\n"
"units DIS\n"
"}\n");

list<string> text_to_lines(const string s)
{
  list<string> lines;
  istringstream is(s);
  string line;
  while(getline(is,line)) lines.push_back(line);
  return lines;
}
/* Build a paz branch with one required key left out */
list<string> paz_without(const string key)
{
  list<string> lines;
  lines.push_back("paz_remove &Arr{");
  if(key!="gain") lines.push_back("gain 1.0");
  if(key!="poles")
  {
    lines.push_back("poles &Tbl{");
    lines.push_back("-1.0 0.0");
    lines.push_back("}");
  }
  if(key!="zeros")
  {
    lines.push_back("zeros &Tbl{");
    lines.push_back("0.0 0.0");
    lines.push_back("}");
  }
  lines.push_back("}");
  return lines;
}
int main(int argc, char **argv)
{
  cout << "test_pf starting"<<endl<<"Testing Metadata"<<endl;
  Metadata md;
  md.put("dt",0.01);
  md.put("npts",1000);
  md.put("sta",string("ANMO"));
  md.put("live",true);
  assert(md.get_double("dt")==0.01);
  assert(md.get_int("npts")==1000);
  assert(md.get_double("npts")==1000.0);
  assert(md.get_string("sta")=="ANMO");
  assert(md.get_bool("live"));
  assert(md.is_defined("dt"));
  md.erase("dt");
  assert(!md.is_defined("dt"));
  try{
    double x=md.get_double("dt");
    cout << "ERROR:  get_double returned "<<x<<" for an erased key"<<endl;
    assert(false);
  }catch(MetadataGetError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
    assert(err.severity()==ErrorSeverity::Suspect);
  }
  cout << "Parsing pf text"<<endl;
  AntelopePf pf(text_to_lines(pftext));
  assert(pf.get_double("water_level")==60.0);
  assert(pf.has_tbl("pre_filter"));
  assert(pf.has_branch("paz_remove"));
  assert(!pf.has_branch("paz_simulate"));
  list<string> akeys=pf.arr_keys();
  assert(akeys.size()==2);
  AntelopePf sr=pf.get_branch("seedresp");
  assert(sr.get_string("date")=="2010,001");
  assert(sr.get_string("locid")=="00");
  try{
    AntelopePf bad=pf.get_branch("no_such_branch");
    assert(false);
  }catch(AntelopePfError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  cout << "Testing SimulationOptions from pf"<<endl;
  SimulationOptions opts(pf);
  assert(opts.get_water_level()==60.0);
  assert(fabs(opts.get_taper_fraction()-0.1)<1e-15);
  assert(opts.get_nfft_pow2());
  assert(!opts.get_remove_sensitivity());
  assert(opts.get_simulate_sensitivity());
  assert(opts.get_zero_mean());
  assert(opts.get_taper());
  assert(opts.has_pre_filter());
  assert(opts.get_pre_filter().get_f1()==0.005);
  assert(opts.get_pre_filter().get_f4()==35.0);
  cout << "Testing InstrumentResponses from pf"<<endl;
  InstrumentResponses resp(pf);
  assert(resp.has_remove());
  assert(!resp.has_simulate());
  assert(resp.has_seedresp());
  const PAZ& paz=resp.get_remove();
  assert(paz.gain()==0.4);
  assert(paz.sensitivity()==1500.0);
  assert(paz.poles().size()==2);
  assert(paz.poles()[1]==Complex64(-4.44,-4.44));
  assert(paz.zeros().size()==2);
  assert(paz.zeros()[1]==Complex64(0.0,0.0));
  const RespDescriptor& desc=resp.get_seedresp();
  assert(desc.filename=="RESP.IU.ANMO.00.BHZ");
  assert(desc.date==RespDate(2010,1));
  assert(desc.locid=="00");
  assert(desc.network=="IU");
  assert(desc.units==RespUnits::DIS);
  cout << "Testing incomplete paz branches"<<endl;
  const char *required[3]={"gain","poles","zeros"};
  for(int i=0;i<3;++i)
  {
    AntelopePf incomplete(paz_without(required[i]));
    try{
      InstrumentResponses r(incomplete);
      assert(false);
    }catch(SeisRespError& err)
    {
      cout << "Correctly threw this message:  "<<err.what()<<endl;
      assert(string(err.what()).find(required[i])!=string::npos);
      assert(err.severity()==ErrorSeverity::Invalid);
    }
  }
  cout << "Testing illegal option values"<<endl;
  list<string> badlines;
  badlines.push_back("taper_fraction 1.5");
  try{
    SimulationOptions bad((AntelopePf(badlines)));
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  badlines.clear();
  badlines.push_back("pre_filter &Tbl{");
  badlines.push_back("0.1 0.2 3.0");
  badlines.push_back("}");
  try{
    SimulationOptions bad((AntelopePf(badlines)));
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  cout << "Testing pfread and pfwrite"<<endl;
  const string pffile("test_pf_output.pf");
  ofstream ofs(pffile.c_str());
  pf.pfwrite(ofs);
  ofs.close();
  AntelopePf pf2=pfread(pffile);
  assert(pf2.get_double("water_level")==60.0);
  assert(pf2.get_tbl("pre_filter").size()==1);
  InstrumentResponses resp2(pf2);
  assert(resp2.get_remove().sensitivity()==1500.0);
  assert(resp2.get_seedresp().locid=="00");
  try{
    AntelopePf missing=pfread("no_such_file.pf");
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  cout << "Testing ErrorLogger"<<endl;
  ErrorLogger elog(7);
  elog.log_verbose("test_pf","informational note");
  elog.log_error("test_pf","a complaint",ErrorSeverity::Complaint);
  elog.log_error(SeisRespError("bad input",ErrorSeverity::Invalid));
  assert(elog.size()==3);
  list<LogData> worst=elog.worst_errors();
  assert(worst.size()==1);
  assert(worst.front().badness==ErrorSeverity::Invalid);
  assert(worst.front().job_id==7);
  ErrorLogger other;
  other.log_error("other","fatal problem",ErrorSeverity::Fatal);
  elog += other;
  assert(elog.size()==4);
  assert(elog.worst_errors().front().badness==ErrorSeverity::Fatal);
  cout << "Testing severity helpers"<<endl;
  assert(string2severity("Complaint")==ErrorSeverity::Complaint);
  assert(severity2string(ErrorSeverity::Suspect)=="Suspect");
  SeisRespError serr("message text",ErrorSeverity::Fatal);
  assert(string(serr.what())=="message text:Fatal");
  assert(parse_message_error_severity(serr)=="Fatal");
  assert(message_error_severity(serr)==ErrorSeverity::Fatal);
  SeisRespError keyword_err(string("from a keyword"),"Complaint");
  assert(keyword_err.severity()==ErrorSeverity::Complaint);
  assert(message_error_severity(keyword_err)==ErrorSeverity::Complaint);
  /* Only the text after the last colon is the keyword */
  assert(parse_message_error_severity(SeisRespError("a:b",ErrorSeverity::Debug))
      =="Debug");
  assert(error_says_data_bad(serr));
  assert(!error_says_data_bad(SeisRespError("note",ErrorSeverity::Complaint)));
  cout << "test_pf exiting with success"<<endl;
}

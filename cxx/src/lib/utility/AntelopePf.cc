#include <ctype.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cstdlib>
#include <string>
#include <vector>
#include <list>
#include <iostream>
#include <fstream>
#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/utility/AntelopePf.h"
namespace seisresp::utility {
using namespace std;
namespace {
enum class PfValue {String, Real, Int, Bool, Arr, Tbl};
const string pf_white(" \t\n\r");
/* 1 for a true word, 0 for a false word, -1 if s is neither.  0 and 1
are not booleans here because they could not be told from an int. */
int boolean_word(const string& s)
{
  static const char *truewords[]={"yes","ok","y","true","on","t"};
  static const char *falsewords[]={"no","n","false","off","f"};
  for(const char *w : truewords) if(s==w) return 1;
  for(const char *w : falsewords) if(s==w) return 0;
  return -1;
}
/* A token is numeric only if it has at least one digit, nothing but
digits, signs, periods and at most one exponent character.  It is Real
if it has a period or exponent. */
PfValue classify(const string& token)
{
  if(token.find("&Arr")!=string::npos) return PfValue::Arr;
  if(token.find("&Tbl")!=string::npos) return PfValue::Tbl;
  if(boolean_word(token)>=0) return PfValue::Bool;
  if(token.empty()
      || token.find_first_not_of("0123456789+-.eE")!=string::npos)
    return PfValue::String;
  int nexp(0),ndigits(0);
  for(char c : token)
  {
    if(c=='e' || c=='E') ++nexp;
    if(isdigit(c)) ++ndigits;
  }
  if(nexp>1 || ndigits==0) return PfValue::String;
  if(token.find_first_of(".eE")!=string::npos) return PfValue::Real;
  return PfValue::Int;
}
/* Blank lines and lines whose first nonwhite character is # carry no
data */
bool skippable(const string& line)
{
  size_t start=line.find_first_not_of(pf_white);
  return start==string::npos || line[start]=='#';
}
/* Key is the first word.  The value is the rest of the line with any
trailing comment and white space removed so strings may contain
blanks. */
pair<string,string> key_and_value(const string& s)
{
  const string white(" \t\r");
  pair<string,string> result;
  size_t is=s.find_first_not_of(white);
  if(is==string::npos) return result;
  size_t ie=s.find_first_of(white,is);
  result.first=s.substr(is,ie==string::npos ? string::npos : ie-is);
  if(ie==string::npos) return result;
  is=s.find_first_not_of(white,ie);
  if(is==string::npos) return result;
  ie=s.find_first_of("\n\r#",is);
  string val=s.substr(is,ie==string::npos ? string::npos : ie-is);
  size_t last=val.find_last_not_of(white);
  if(last!=string::npos) val.erase(last+1);
  result.second=val;
  return result;
}
/* Index of the line holding the closing bracket of the block that
opens on lines[first] */
size_t block_end(const vector<string>& lines, const size_t first)
{
  int depth(0);
  for(size_t i=first;i<lines.size();++i)
  {
    if(lines[i].find('{')!=string::npos) ++depth;
    if(lines[i].find('}')!=string::npos) --depth;
    if(depth==0) return i;
  }
  throw AntelopePfError("unterminated block starting with line->"+lines[first]);
}
/* Every file in the PFPATH directory list s.  .pf is appended to
pfbase when missing. */
list<string> pfpath_files(string pfbase, const string s)
{
  const string suffix(".pf");
  if(pfbase.size()<suffix.size()
      || pfbase.compare(pfbase.size()-suffix.size(),suffix.size(),suffix)!=0)
    pfbase+=suffix;
  list<string> result;
  istringstream ss(s);
  string dir;
  while(getline(ss,dir,':'))
    if(!dir.empty()) result.push_back(dir+"/"+pfbase);
  return result;
}
}
AntelopePf pfread(const string fname)
{
  const string base_error("seisresp::utility::pfread:  ");
  /* ifstream does not report a missing file distinctly */
  struct stat buffer;
  if(stat(fname.c_str(),&buffer))
    throw SeisRespError(base_error+"file="+fname+" does not exist",
        ErrorSeverity::Invalid);
  ifstream inp(fname.c_str());
  if(inp.fail())
    throw SeisRespError(base_error + "open failed for file="+fname,
        ErrorSeverity::Invalid);
  list<string> lines;
  string rawline;
  while(getline(inp,rawline))
    if(!skippable(rawline)) lines.push_back(rawline);
  return AntelopePf(lines);
}
/* Arr blocks recurse through this constructor */
AntelopePf::AntelopePf(list<string> alllines) : Metadata()
{
  const string base_error("AntelopePf constructor:  ");
  const vector<string> lines(alllines.begin(),alllines.end());
  for(size_t i=0;i<lines.size();++i)
  {
    if(skippable(lines[i])) continue;
    pair<string,string> kv=key_and_value(lines[i]);
    const string& key=kv.first;
    const string& value=kv.second;
    if(value.empty())
      throw AntelopePfError(base_error
          +"No value given for key on this line->"+lines[i]);
    PfValue vt=classify(value);
    if(vt==PfValue::Tbl || vt==PfValue::Arr)
    {
      /* The opening and closing lines are not part of the block */
      size_t last=block_end(lines,i);
      list<string> block;
      for(size_t j=i+1;j<last;++j)
        if(vt==PfValue::Arr || !skippable(lines[j]))
          block.push_back(lines[j]);
      if(vt==PfValue::Tbl)
        pftbls[key]=block;
      else
        pfbranches[key]=AntelopePf(block);
      i=last;
      continue;
    }
    pfstrings[key]=value;
    switch(vt)
    {
      case PfValue::Real:
        this->put(key,atof(value.c_str()));
        break;
      case PfValue::Int:
        this->put(key,atoi(value.c_str()));
        break;
      case PfValue::Bool:
        this->put<bool>(key,boolean_word(value)==1);
        break;
      default:
        this->put(key,value);
    };
  }
}
int AntelopePf::merge_pfmf(AntelopePf& m)
{
  this->Metadata::operator+=(m);
  for(auto& kv : m.pfstrings) pfstrings[kv.first]=kv.second;
  for(auto& kv : m.pftbls) pftbls[kv.first]=kv.second;
  for(auto& kv : m.pfbranches) pfbranches[kv.first]=kv.second;
  return m.pftbls.size()+m.pfbranches.size();
}
AntelopePf::AntelopePf(string pfbase)
{
  const char *s=getenv("PFPATH");
  list<string> pffiles;
  if(s==NULL)
  {
    pffiles.push_back(pfbase);
    if(pfbase.find(".pf")==string::npos) pffiles.push_back(pfbase+".pf");
  }
  else if(!pfbase.empty() && pfbase[0]=='/')
    pffiles.push_back(pfbase);
  else
    pffiles=pfpath_files(pfbase,string(s));
  /* Later files in the chain override earlier ones */
  int nread(0);
  for(auto& f : pffiles)
  {
    if(access(f.c_str(),R_OK)) continue;
    AntelopePf pfnext=pfread(f);
    if(nread==0)
      *this=pfnext;
    else
      this->merge_pfmf(pfnext);
    ++nread;
  }
  if(nread>0) return;
  if(s==NULL)
    throw SeisRespError(string("PFPATH is not defined and default pf=")
        + pfbase + " was not found",ErrorSeverity::Invalid);
  throw SeisRespError(string("PFPATH=")+s
      +" had no pf files matching " + pfbase,ErrorSeverity::Invalid);
}
AntelopePf::AntelopePf(const AntelopePf& parent)
  : Metadata(parent),pftbls(parent.pftbls),pfbranches(parent.pfbranches),
    pfstrings(parent.pfstrings)
{
}
AntelopePf& AntelopePf::operator=(const AntelopePf& parent)
{
  if(this!=&parent)
  {
    this->Metadata::operator=(parent);
    pftbls=parent.pftbls;
    pfbranches=parent.pfbranches;
    pfstrings=parent.pfstrings;
  }
  return *this;
}
string AntelopePf::get_string(const string key) const
{
  if(this->is_defined(key) && md.at(key).type()==typeid(string))
    return Metadata::get_string(key);
  map<string,string>::const_iterator sptr=pfstrings.find(key);
  if(sptr!=pfstrings.end()) return sptr->second;
  /* Throws the standard missing key error */
  return Metadata::get_string(key);
}
list<string> AntelopePf::get_tbl(const string key) const
{
  auto iptr=pftbls.find(key);
  if(iptr==pftbls.end())
    throw AntelopePfError("get_tbl failed trying to find data for key="+key);
  return iptr->second;
}
AntelopePf AntelopePf::get_branch(const string key) const
{
  auto iptr=pfbranches.find(key);
  if(iptr==pfbranches.end())
    throw AntelopePfError("get_branch failed trying to find data for key="+key);
  return iptr->second;
}
list<string> AntelopePf::arr_keys() const
{
  list<string> result;
  for(auto& kv : pfbranches) result.push_back(kv.first);
  return result;
}
list<string> AntelopePf::tbl_keys() const
{
  list<string> result;
  for(auto& kv : pftbls) result.push_back(kv.first);
  return result;
}
/* Simple values first, then Tbls, then Arrs.  Each group is in key
order. */
void AntelopePf::pfwrite(ostream& ofs) const
{
  for(auto& kv : md)
  {
    const boost::any& a=kv.second;
    const type_info& ti=a.type();
    ostringstream ss;
    if(ti==typeid(bool))
      ss<<(boost::any_cast<bool>(a) ? "true" : "false");
    else if(ti==typeid(int))
    {
      /* Keep text like 00 as written unless the value was changed */
      int ival=boost::any_cast<int>(a);
      auto sptr=pfstrings.find(kv.first);
      if(sptr!=pfstrings.end() && atoi(sptr->second.c_str())==ival)
        ss<<sptr->second;
      else
        ss<<ival;
    }
    else if(ti==typeid(long))
      ss<<boost::any_cast<long>(a);
    else if(ti==typeid(double))
    {
      ss.precision(17);
      ss<<boost::any_cast<double>(a);
      /* Needs a period or exponent to read back as a real */
      if(ss.str().find_first_of(".eE")==string::npos) ss<<".0";
    }
    else if(ti==typeid(string))
      ss<<boost::any_cast<string>(a);
    else
      continue;
    ofs<<kv.first<<" "<<ss.str()<<endl;
  }
  for(auto& kv : pftbls)
  {
    ofs<<kv.first<<" &Tbl{"<<endl;
    for(auto& line : kv.second) ofs<<line<<endl;
    ofs<<"}"<<endl;
  }
  for(auto& kv : pfbranches)
  {
    ofs<<kv.first<<" &Arr{"<<endl;
    kv.second.pfwrite(ofs);
    ofs<<"}"<<endl;
  }
}
}

#include <math.h>
#include <limits>
#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/algorithms/Taper.h"
namespace seisresp::algorithms
{
using namespace std;
using namespace seisresp::utility;

vector<double> cosine_taper(const int npts, const double fraction)
{
  if(fraction<0.0 || fraction>1.0)
  {
    stringstream ss;
    ss<<"cosine_taper:  illegal taper fraction="<<fraction<<endl
      <<"Must be in the range 0 to 1"<<endl;
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  vector<double> w;
  if(npts<=0) return w;
  w.assign(npts,1.0);
  int nramp=static_cast<int>(static_cast<double>(npts)*fraction/2.0);
  if(fraction!=0.0 && fraction!=1.0) ++nramp;
  if(nramp>npts/2) nramp=npts/2;
  if(nramp<=0) return w;
  for(int i=0;i<nramp;++i)
  {
    double theta;
    if(nramp==1)
      theta=M_PI;
    else
      theta=M_PI+M_PI*static_cast<double>(i)/static_cast<double>(nramp-1);
    double wt=0.5*(1.0+cos(theta));
    w[i]=wt;
    w[npts-1-i]=wt;
  }
  return w;
}

PreFilter::PreFilter()
{
  f1=0.0;
  f2=0.0;
  f3=std::numeric_limits<double>::max();
  f4=std::numeric_limits<double>::max();
}
PreFilter::PreFilter(const double fc1, const double fc2, const double fc3,
    const double fc4)
{
  if(fc1<0.0 || fc1>fc2 || fc2>fc3 || fc3>fc4)
  {
    stringstream ss;
    ss<<"PreFilter constructor:  illegal corner frequencies"<<endl
      <<"Received f1="<<fc1<<", f2="<<fc2<<", f3="<<fc3<<", f4="<<fc4<<endl
      <<"Corners must be nonnegative and satisfy f1<=f2<=f3<=f4"<<endl;
    throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
  }
  f1=fc1;
  f2=fc2;
  f3=fc3;
  f4=fc4;
}
PreFilter::PreFilter(const PreFilter& parent)
  : f1(parent.f1),f2(parent.f2),f3(parent.f3),f4(parent.f4)
{
}
PreFilter& PreFilter::operator=(const PreFilter& parent)
{
  if(this!=&parent)
  {
    f1=parent.f1;
    f2=parent.f2;
    f3=parent.f3;
    f4=parent.f4;
  }
  return *this;
}
double PreFilter::weight(const double f) const
{
  if(f<f1 || f>f4) return 0.0;
  if(f<f2)
    return 0.5*(1.0-cos(M_PI*(f1-f)/(f2-f1)));
  if(f<=f3) return 1.0;
  return 0.5*(1.0+cos(M_PI*(f3-f)/(f4-f3)));
}
vector<double> PreFilter::window(const vector<double>& freqs) const
{
  vector<double> w;
  w.reserve(freqs.size());
  for(auto fptr=freqs.begin();fptr!=freqs.end();++fptr)
    w.push_back(this->weight(*fptr));
  return w;
}
void PreFilter::apply(ComplexArray& spec, const vector<double>& freqs) const
{
  vector<double> w=this->window(freqs);
  spec *= w;
}
}

#include "seisresp/algorithms/algorithms.h"
namespace seisresp::algorithms
{
using namespace std;

vector<double> detrend_mean(const vector<double>& d)
{
  vector<double> result(d);
  if(d.empty()) return result;
  double sum(0.0);
  for(auto dptr=d.begin();dptr!=d.end();++dptr) sum += (*dptr);
  double avg=sum/static_cast<double>(d.size());
  for(auto rptr=result.begin();rptr!=result.end();++rptr) (*rptr) -= avg;
  return result;
}
vector<double> detrend_linear(const vector<double>& d)
{
  vector<double> result(d);
  int npts=d.size();
  if(npts==0) return result;
  if(npts==1)
  {
    result[0]=0.0;
    return result;
  }
  double slope=(d[npts-1]-d[0])/static_cast<double>(npts-1);
  for(int i=0;i<npts;++i)
    result[i] -= (d[0]+slope*static_cast<double>(i));
  return result;
}
}

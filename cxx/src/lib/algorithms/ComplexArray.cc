#include <algorithm>
#include <cmath>
#include <sstream>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/algorithms/ComplexArray.h"
namespace seisresp::algorithms
{
using namespace std;
using namespace seisresp::utility;

ComplexArray::ComplexArray(int n) : data(2*n,0.0),nsamp(n)
{
}
ComplexArray::ComplexArray(int n, const vector<double>& d)
  : data(2*n,0.0),nsamp(n)
{
  int ncopy=min(static_cast<int>(d.size()),nsamp);
  for(int i=0;i<ncopy;++i) data[2*i]=d[i];
}
namespace {
void size_check(const string op, const int lhs, const int rhs)
{
  if(lhs==rhs) return;
  stringstream ss;
  ss<<"ComplexArray::"<<op<<":  array sizes do not match"
    <<" (left="<<lhs<<", right="<<rhs<<")";
  throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
}
}
ComplexArray& ComplexArray::operator *= (const ComplexArray& other)
{
  size_check("operator*=",nsamp,other.nsamp);
  for(int i=0;i<nsamp;++i) this->set(i,(*this)[i]*other[i]);
  return *this;
}
ComplexArray& ComplexArray::operator *= (const vector<double>& w)
{
  size_check("operator*=(vector<double>)",nsamp,w.size());
  for(int i=0;i<nsamp;++i)
  {
    data[2*i]*=w[i];
    data[2*i+1]*=w[i];
  }
  return *this;
}
void ComplexArray::conj()
{
  for(int i=0;i<nsamp;++i) data[2*i+1]=-data[2*i+1];
}
double ComplexArray::max_abs() const
{
  double result(0.0);
  for(int i=0;i<nsamp;++i)
    result=max(result,hypot(data[2*i],data[2*i+1]));
  return result;
}
}

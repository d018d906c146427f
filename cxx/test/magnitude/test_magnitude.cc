#include <iostream>
#include <cassert>
#include <math.h>
#include <vector>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/response/PAZ.h"
#include "seisresp/algorithms/magnitude.h"
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;
using namespace seisresp::response;
int main(int argc, char **argv)
{
  cout << "test_magnitude starting"<<endl;
  vector<Complex64> poles,zeros;
  poles.push_back(Complex64(-4.444,4.444));
  poles.push_back(Complex64(-4.444,-4.444));
  poles.push_back(Complex64(-1.083,0.0));
  zeros.assign(3,Complex64(0.0,0.0));
  PAZ paz(poles,zeros,1.0,671140000.0);
  cout << "Testing single reading"<<endl;
  double ml=local_magnitude(paz,3.34e6,0.065,0.255);
  cout << "ml="<<ml<<endl;
  assert(fabs(ml-2.165345)<1e-6);
  double wa=wood_anderson_amplitude(paz,3.34e6,0.065);
  assert(wa>0.0);
  double mlwa=log10(wa)+log10(0.255/100.0)+0.00301*(0.255-100.0)+3.0;
  assert(fabs(ml-mlwa)<1e-12);
  cout << "Testing two component average"<<endl;
  vector<PAZ> pazlist(2,paz);
  vector<double> amps,spans;
  amps.push_back(3.34e6);
  amps.push_back(5.0e6);
  spans.push_back(0.065);
  spans.push_back(0.1);
  ml=local_magnitude(pazlist,amps,spans,0.255);
  cout << "ml="<<ml<<endl;
  assert(fabs(ml-2.386788)<1e-6);
  cout << "A list of one reading matches the single reading form"<<endl;
  vector<PAZ> one(1,paz);
  vector<double> a1(1,3.34e6),t1(1,0.065);
  assert(fabs(local_magnitude(one,a1,t1,0.255)-2.165345)<1e-6);
  cout << "Testing error conditions"<<endl;
  spans.pop_back();
  try{
    ml=local_magnitude(pazlist,amps,spans,0.255);
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
    assert(err.severity()==ErrorSeverity::Invalid);
  }
  vector<PAZ> nopaz;
  vector<double> none;
  try{
    ml=local_magnitude(nopaz,none,none,0.255);
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  try{
    wa=wood_anderson_amplitude(paz,3.34e6,0.0);
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  PAZ nosens(poles,zeros,1.0);
  try{
    wa=wood_anderson_amplitude(nosens,3.34e6,0.065);
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  cout << "test_magnitude exiting with success"<<endl;
}

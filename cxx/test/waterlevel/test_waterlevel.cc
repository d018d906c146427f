#include <iostream>
#include <cassert>
#include <math.h>
#include <vector>
#include "seisresp/algorithms/ComplexArray.h"
#include "seisresp/algorithms/WaterLevel.h"
#include "seisresp/algorithms/FFTEngine.h"
#include "seisresp/algorithms/algorithms.h"
#include "seisresp/utility/SeisRespError.h"
using namespace std;
using namespace seisresp::algorithms;
using namespace seisresp::utility;
int main(int argc, char **argv)
{
  cout << "test_waterlevel starting"<<endl
    << "Building spectrum with a 1000:1 amplitude range and two zero bins"<<endl;
  const int n(64);
  ComplexArray spec(n);
  for(int i=0;i<n;++i)
  {
    double amp=pow(10.0,-3.0*static_cast<double>(i)/static_cast<double>(n-1));
    double phase=0.1*static_cast<double>(i);
    spec.set(i,Complex64(amp*cos(phase),amp*sin(phase)));
  }
  spec.set(5,Complex64(0.0,0.0));
  spec.set(40,Complex64(0.0,0.0));
  ComplexArray original(spec);
  const double wl(20.0);
  double swamp=water_level_amplitude(spec,wl);
  cout << "water level amplitude="<<swamp<<endl;
  assert(fabs(swamp-0.1)<1e-12);
  int nclamped=invert_with_water_level(spec,wl);
  cout << "Number of clamped bins="<<nclamped<<endl;
  int nexpected(0);
  for(int i=0;i<n;++i)
  {
    double a=abs(original[i]);
    if(a>0.0 && a<swamp) ++nexpected;
  }
  assert(nclamped==nexpected);
  assert(nclamped>0);
  cout << "Testing zero bins map to 0"<<endl;
  assert(spec[5]==Complex64(0.0,0.0));
  assert(spec[40]==Complex64(0.0,0.0));
  cout << "Testing amplitude bound and phase of the inverse"<<endl;
  for(int i=0;i<n;++i)
  {
    if(i==5 || i==40) continue;
    double a=abs(spec[i]);
    assert(a>0.0);
    assert(a<=(1.0/swamp)*(1.0+1e-12));
    double aorig=abs(original[i]);
    if(aorig>=swamp)
      assert(abs(spec[i]*original[i]-Complex64(1.0,0.0))<1e-12);
    else
    {
      assert(fabs(a-1.0/swamp)<1e-9);
      /* inverse phase is the negative of the input phase */
      assert(fabs(arg(spec[i])+arg(original[i]))<1e-9);
    }
  }
  cout << "Testing 600 dB level leaves the spectrum unclamped"<<endl;
  ComplexArray spec2(original);
  assert(invert_with_water_level(spec2,600.0)==0);
  assert(abs(spec2[0]-Complex64(1.0,0.0))<1e-12);
  cout << "Testing transform length rules"<<endl;
  assert(nextPowerOf2(1000)==1024);
  assert(nextPowerOf2(1024)==1024);
  assert(ComputeFFTLength(1000)==2000);
  assert(ComputeFFTLength(1001)==2004);
  assert(ComputeFFTLength(1000,true)==2048);
  cout << "Testing rfft/irfft pair"<<endl;
  vector<double> x;
  for(int i=0;i<100;++i) x.push_back(sin(0.3*static_cast<double>(i))+0.01*i);
  FFTEngine fft(ComputeFFTLength(x.size()));
  ComplexArray X=fft.rfft(x);
  assert(X.size()==101);
  vector<double> xr=fft.irfft(X);
  assert(xr.size()==200);
  for(size_t i=0;i<x.size();++i) assert(fabs(xr[i]-x[i])<1e-10);
  for(size_t i=x.size();i<xr.size();++i) assert(fabs(xr[i])<1e-10);
  cout << "Testing copy and resize of the fft engine"<<endl;
  FFTEngine fft2(fft);
  assert(fft2.get_size()==200);
  assert(fft2.number_bins()==101);
  assert(fabs(fft2.df(0.01)-0.5)<1e-12);
  vector<double> fgrid=fft2.frequencies(0.01);
  assert(fgrid.size()==101);
  assert(fgrid[0]==0.0);
  assert(fabs(fgrid[1]-0.5)<1e-12);
  /* Last bin is the 50 Hz Nyquist */
  assert(fabs(fgrid[100]-50.0)<1e-9);
  fft2.change_size(256);
  assert(fft2.get_size()==256);
  vector<double> xr2=fft2.irfft(fft2.rfft(x));
  assert(xr2.size()==256);
  for(size_t i=0;i<x.size();++i) assert(fabs(xr2[i]-x[i])<1e-10);
  try{
    fft2.irfft(X);
    cout << "ERROR:  irfft accepted a spectrum of the wrong size"<<endl;
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  cout << "Testing detrend helpers"<<endl;
  vector<double> line;
  for(int i=0;i<11;++i) line.push_back(3.0+2.0*i);
  vector<double> dl=detrend_linear(line);
  for(auto v : dl) assert(fabs(v)<1e-12);
  vector<double> dm=detrend_mean(line);
  assert(fabs(dm[5])<1e-12);
  assert(fabs(dm[0]+10.0)<1e-12);
  vector<double> one(1,7.0);
  assert(detrend_linear(one)[0]==0.0);
  cout << "test_waterlevel exiting with success"<<endl;
}

#include <iostream>
#include <cassert>
#include <math.h>
#include <vector>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/algorithms/ComplexArray.h"
#include "seisresp/response/PAZ.h"
using namespace std;
using namespace seisresp::utility;
using namespace seisresp::algorithms;
using namespace seisresp::response;
/* Evaluates the zero-pole-gain product form directly for comparison */
Complex64 zpk_response(const PAZ& paz, const double f)
{
  Complex64 s(0.0,2.0*M_PI*f);
  Complex64 h(paz.gain(),0.0);
  for(auto z : paz.zeros()) h *= (s-z);
  for(auto p : paz.poles()) h /= (s-p);
  return h;
}
int main(int argc, char **argv)
{
  cout << "test_paz starting"<<endl;
  vector<Complex64> poles,zeros;
  poles.push_back(Complex64(-4.44,4.44));
  poles.push_back(Complex64(-4.44,-4.44));
  zeros.push_back(Complex64(0.0,0.0));
  zeros.push_back(Complex64(0.0,0.0));
  PAZ paz(poles,zeros,0.4);
  assert(!paz.has_sensitivity());
  cout << "Testing paz_amplitude_at"<<endl;
  double amp=paz_amplitude_at(paz,1.0);
  cout << "Amplitude at 1 Hz="<<amp<<endl;
  assert(fabs(amp-0.2830262)<1e-6);
  cout << "Testing poly and polyval"<<endl;
  vector<Complex64> c=poly(poles);
  assert(c.size()==3);
  assert(abs(c[0]-Complex64(1.0,0.0))<1e-12);
  assert(abs(c[1]-Complex64(8.88,0.0))<1e-12);
  assert(abs(c[2]-Complex64(2.0*4.44*4.44,0.0))<1e-10);
  assert(abs(polyval(c,poles[0]))<1e-10);
  vector<Complex64> empty;
  assert(poly(empty).size()==1);
  cout << "Testing paz_to_freq_response"<<endl;
  const double delta(0.01);
  const int nfft(200);
  FrequencyResponse fr=paz_to_freq_response(paz,delta,nfft);
  assert(fr.h.size()==nfft/2+1);
  assert(static_cast<int>(fr.f.size())==nfft/2+1);
  assert(fr.f[0]==0.0);
  assert(fabs(fr.f[nfft/2]-50.0)<1e-12);
  assert(fabs(fr.f[2]-1.0)<1e-12);
  assert(fabs(std::abs(fr.h[2])-amp)<1e-12);
  /* The returned response is the conjugate of the analog response */
  for(int k=1;k<=nfft/2;k+=7)
  {
    Complex64 h=zpk_response(paz,fr.f[k]);
    assert(abs(fr.h[k]-conj(h))<1e-10*abs(h));
  }
  assert(fr.h[2].imag()*zpk_response(paz,1.0).imag()<0.0);
  /* Two zeros at the origin */
  assert(std::abs(fr.h[0])==0.0);
  cout << "Testing illegal arguments"<<endl;
  try{
    FrequencyResponse bad=paz_to_freq_response(paz,-1.0,nfft);
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  try{
    PAZ bad(poles,zeros,0.0);
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  try{
    double s=paz.sensitivity();
    cout << "ERROR:  sensitivity returned "<<s<<" for a PAZ with no sensitivity"<<endl;
    assert(false);
  }catch(SeisRespError& err)
  {
    cout << "Correctly threw this message:  "<<err.what()<<endl;
  }
  cout << "Testing corner_freq_to_paz"<<endl;
  const double fc(1.0/120.0);
  PAZ sts2=corner_freq_to_paz(fc);
  assert(sts2.poles().size()==2);
  assert(sts2.zeros().size()==2);
  assert(sts2.gain()==1.0);
  assert(sts2.sensitivity()==1.0);
  Complex64 p0=sts2.poles()[0];
  Complex64 p1=sts2.poles()[1];
  assert(abs(p0-conj(p1))<1e-15);
  assert(fabs(p0.real()+0.707*2.0*M_PI*fc)<1e-12);
  assert(fabs(std::abs(p0)-2.0*M_PI*fc)<1e-12);
  for(auto z : sts2.zeros()) assert(z==Complex64(0.0,0.0));
  PAZ damped=corner_freq_to_paz(1.0,0.5);
  assert(fabs(damped.poles()[0].real()+M_PI)<1e-12);
  cout << "Testing Wood-Anderson reference instrument"<<endl;
  PAZ wa=WoodAndersonPAZ();
  assert(wa.sensitivity()==2080.0);
  assert(wa.zeros().size()==1);
  assert(wa.poles().size()==2);
  cout << "test_paz exiting with success"<<endl;
}

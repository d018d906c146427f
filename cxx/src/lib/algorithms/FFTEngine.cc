#include <math.h>
#include <sstream>
#include "seisresp/algorithms/FFTEngine.h"
#include "seisresp/utility/SeisRespError.h"
namespace seisresp::algorithms
{
using namespace std;
using namespace seisresp::utility;

FFTEngine::FFTEngine()
{
    nfft=0;
    wavetable=NULL;
    workspace=NULL;
}
FFTEngine::FFTEngine(const int n)
{
    nfft=n;
    wavetable=NULL;
    workspace=NULL;
    this->allocate();
}
FFTEngine::FFTEngine(const FFTEngine& parent)
{
    nfft=parent.nfft;
    wavetable=NULL;
    workspace=NULL;
    /* copies need their own work space */
    if(nfft>0) this->allocate();
}
FFTEngine::~FFTEngine()
{
    this->release();
}
FFTEngine& FFTEngine::operator=(const FFTEngine& parent)
{
    if(this != &parent)
    {
        this->release();
        nfft=parent.nfft;
        if(nfft>0) this->allocate();
    }
    return *this;
}
void FFTEngine::change_size(const int n)
{
    if(n==nfft && wavetable!=NULL) return;
    this->release();
    nfft=n;
    this->allocate();
}
void FFTEngine::allocate()
{
    const string base_error("FFTEngine:  ");
    if(nfft<2)
    {
        stringstream ss;
        ss<<base_error<<"illegal fft length="<<nfft<<" - must be at least 2";
        throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
    }
    wavetable = gsl_fft_complex_wavetable_alloc (nfft);
    workspace = gsl_fft_complex_workspace_alloc (nfft);
    if(wavetable==NULL || workspace==NULL)
    {
        this->release();
        throw SeisRespError(base_error+"gsl work space allocation failed",
                ErrorSeverity::Fatal);
    }
}
void FFTEngine::release()
{
    if(wavetable!=NULL) gsl_fft_complex_wavetable_free (wavetable);
    if(workspace!=NULL) gsl_fft_complex_workspace_free (workspace);
    wavetable=NULL;
    workspace=NULL;
}
ComplexArray FFTEngine::rfft(const vector<double>& d)
{
    ComplexArray work(nfft,d);
    int iret=gsl_fft_complex_forward(work.ptr(),1,nfft,wavetable,workspace);
    if(iret!=GSL_SUCCESS)
        throw SeisRespError(string("FFTEngine::rfft:  gsl_fft_complex_forward failed:  ")
                + gsl_strerror(iret),ErrorSeverity::Invalid);
    int nbins=this->number_bins();
    ComplexArray result(nbins);
    for(int k=0;k<nbins;++k) result.set(k,work[k]);
    return result;
}
vector<double> FFTEngine::irfft(const ComplexArray& spec)
{
    const string base_error("FFTEngine::irfft:  ");
    int nbins=this->number_bins();
    if(spec.size()!=nbins)
    {
        stringstream ss;
        ss<<base_error<<"spectrum size="<<spec.size()
          <<" does not match required size="<<nbins<<" for nfft="<<nfft;
        throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
    }
    ComplexArray work(nfft);
    work.set(0,Complex64(spec[0].real(),0.0));
    for(int k=1;k<nbins;++k)
    {
        int kneg=nfft-k;
        if(kneg==k)
        {
            /* Nyquist bin of an even length transform */
            work.set(k,Complex64(spec[k].real(),0.0));
        }
        else
        {
            work.set(k,spec[k]);
            work.set(kneg,std::conj(spec[k]));
        }
    }
    int iret=gsl_fft_complex_inverse(work.ptr(),1,nfft,wavetable,workspace);
    if(iret!=GSL_SUCCESS)
        throw SeisRespError(base_error+"gsl_fft_complex_inverse failed:  "
                + gsl_strerror(iret),ErrorSeverity::Invalid);
    vector<double> result;
    result.reserve(nfft);
    for(int k=0;k<nfft;++k) result.push_back(work[k].real());
    return result;
}
vector<double> FFTEngine::frequencies(const double dt) const
{
    int nbins=this->number_bins();
    double delf=this->df(dt);
    vector<double> f;
    f.reserve(nbins);
    for(int k=0;k<nbins;++k) f.push_back(delf*static_cast<double>(k));
    return f;
}

unsigned int nextPowerOf2(unsigned int n)
{
    unsigned int p=1;
    if(n && !(n&(n-1))) return n;
    while(p<n) p <<= 1;
    return p;
}
int ComputeFFTLength(const int npts, const bool force_pow2)
{
    if(npts<=0)
    {
        stringstream ss;
        ss<<"ComputeFFTLength:  illegal number of samples="<<npts
          <<" - must be positive";
        throw SeisRespError(ss.str(),ErrorSeverity::Invalid);
    }
    if(force_pow2)
        return static_cast<int>(nextPowerOf2(2*static_cast<unsigned int>(npts)));
    if(npts%2)
        return 2*(npts+1);
    else
        return 2*npts;
}
}  //End namespace

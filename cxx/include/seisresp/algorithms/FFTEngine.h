#ifndef _SEISRESP_FFT_ENGINE_H_
#define _SEISRESP_FFT_ENGINE_H_
#include <vector>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_fft_complex.h>
#include "seisresp/algorithms/ComplexArray.h"
namespace seisresp::algorithms{
/*! \brief Real signal fft built on the GSL mixed radix complex fft.

The GNU Scientific Library prime factorization fft requires initialization
for a given length to load and store the factorization data.  This object
holds these and recomputes them only when the length changes.

Real data are transformed with the complex routine and only the
nfft/2+1 non-negative frequency bins are returned.  The inverse
rebuilds the Hermitian spectrum from those bins so the pair behaves
like a conventional real-to-complex fft with the 1/nfft normalization
applied on the inverse.  */
class FFTEngine
{
public:
    FFTEngine();
    /*! Construct for a transform of length nfft.

    \exception SeisRespError if nfft is less than 2. */
    FFTEngine(const int nfft);
    FFTEngine(const FFTEngine& parent);
    ~FFTEngine();
    FFTEngine& operator=(const FFTEngine& parent);
    /*! Change the transform length.  Reallocates GSL work space. */
    void change_size(const int nfft_new);
    int get_size() const {return nfft;};
    /*! Number of non-negative frequency bins (nfft/2+1). */
    int number_bins() const {return nfft/2+1;};
    double df(const double dt) const {
        double period;
        period=static_cast<double>(nfft)*dt;
        return 1.0/period;
    };
    /*! \brief Forward transform of real samples.

    d is zero padded (or truncated) to the transform length.
    \return nfft/2+1 complex bins for frequencies 0 to Nyquist. */
    ComplexArray rfft(const std::vector<double>& d);
    /*! \brief Inverse transform back to real samples.

    \param spec must contain nfft/2+1 bins as returned by rfft.  The
      imaginary parts of the zero frequency and (for even nfft) Nyquist
      bins are ignored.
    \return nfft real samples.
    \exception SeisRespError if spec has the wrong size.
    */
    std::vector<double> irfft(const ComplexArray& spec);
    /*! Return the frequencies (Hz) of the rfft bins for sample interval dt. */
    std::vector<double> frequencies(const double dt) const;
protected:
    int nfft;
    gsl_fft_complex_wavetable *wavetable;
    gsl_fft_complex_workspace *workspace;
private:
    void allocate();
    void release();
};

/*! Returns next power of 2 larger than or equal to n. */
unsigned int nextPowerOf2(unsigned int n);
/*! \brief Transform length used for instrument correction of npts samples.

The transform has at least twice the number of data samples to avoid
wraparound from circular convolution.  With force_pow2 true the result
is the next power of 2 at or above 2*npts.   Otherwise it is 2*npts
for even npts and 2*(npts+1) for odd npts.

\exception SeisRespError if npts is not positive.
*/
int ComputeFFTLength(const int npts, const bool force_pow2=false);
}
#endif

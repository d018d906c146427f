#ifndef _SEISRESP_COMPLEX_ARRAY_H_
#define _SEISRESP_COMPLEX_ARRAY_H_

#include <complex>
#include <vector>

namespace seisresp::algorithms{
typedef std::complex<double> Complex64;

/*! \brief Container for a complex spectrum or frequency response.

   Data are stored in the multiplexed layout (real(0), imag(0), real(1),
   imag(1), ...) used by GSL's complex fft routines so the ptr method
   can be passed directly to gsl_fft_complex_forward and
   gsl_fft_complex_inverse.  Copies are deep.
   */
class ComplexArray
{
public:
    ComplexArray() : nsamp(0){};
    /*! Construct an array of zeros of length nsamp. */
    explicit ComplexArray(int nsamp);
    /*! \brief Construct zero padded from a real vector.

      Copies d into the real part of the first d.size() samples.  The
      rest of the nsamp samples are zero.  If d is longer than nsamp it
      is truncated. */
    ComplexArray(int nsamp, const std::vector<double>& d);
    Complex64 operator[](int sample) const
    {
      return Complex64(data[2*sample],data[2*sample+1]);
    };
    void set(int sample, const Complex64 z)
    {
      data[2*sample]=z.real();
      data[2*sample+1]=z.imag();
    };
    /*! Pointer to the real part of sample 0 in GSL packed form. */
    double *ptr(){return data.data();};
    /*! Sample by sample multiply.  Sizes must match. */
    ComplexArray& operator *= (const ComplexArray& other);
    /*! Multiply each sample by a real weight (e.g. a spectral window). */
    ComplexArray& operator *= (const std::vector<double>& w);
    /*! Change vector to complex conjugates. */
    void conj();
    /*! Return largest amplitude.  Returns 0 for an empty array. */
    double max_abs() const;
    int size() const {return nsamp;};
private:
    std::vector<double> data;
    int nsamp;
};
}
#endif

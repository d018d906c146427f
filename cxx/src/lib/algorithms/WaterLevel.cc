#include <math.h>
#include "seisresp/algorithms/WaterLevel.h"
namespace seisresp::algorithms
{
using namespace std;

double water_level_amplitude(const ComplexArray& spec, const double water_level_db)
{
  return spec.max_abs()*pow(10.0,-water_level_db/20.0);
}
int invert_with_water_level(ComplexArray& spec, const double water_level_db)
{
  double swamp=water_level_amplitude(spec,water_level_db);
  int nclamped(0);
  for(int i=0;i<spec.size();++i)
  {
    Complex64 z=spec[i];
    double amp=std::abs(z);
    if(amp>0.0 && amp<swamp)
    {
      z *= (swamp/amp);
      ++nclamped;
    }
    if(std::abs(z)>0.0)
      spec.set(i,1.0/z);
    else
      spec.set(i,Complex64(0.0,0.0));
  }
  return nclamped;
}
}

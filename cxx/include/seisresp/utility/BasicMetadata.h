#ifndef _SEISRESP_BASICMETADATA_H_
#define _SEISRESP_BASICMETADATA_H_
#include <string>

namespace seisresp
{
namespace utility{
/*! \brief Abstract base class for Metadata concept.

Processing parameters in this library are carried in a generic key-value
container.  This base class forces support for the standard basic data
types every configuration source must provide.
*/
class BasicMetadata
{
public:
  virtual ~BasicMetadata(){};
  virtual int get_int(const std::string key) const =0;
  virtual double get_double(const std::string key)const =0;
  virtual bool get_bool(const std::string key) const =0;
  virtual std::string get_string(const std::string key)const =0;
  virtual void put(const std::string key, const double val)=0;
  virtual void put(const std::string key, const int val)=0;
  virtual void put(const std::string key, const bool val)=0;
  virtual void put(const std::string key, const std::string val)=0;
};
} // end utility namespace
}   // End seisresp namespace encapsulation
#endif

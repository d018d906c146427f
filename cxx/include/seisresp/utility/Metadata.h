#ifndef _SEISRESP_METADATA_H_
#define _SEISRESP_METADATA_H_
#include <typeinfo>
#include <map>
#include <set>
#include <iostream>
#include <sstream>
#include <boost/any.hpp>
#include <boost/core/demangle.hpp>
#include "seisresp/utility/SeisRespError.h"
#include "seisresp/utility/BasicMetadata.h"

namespace seisresp::utility{
/*! \brief Error thrown when a Metadata get fails.

Always Suspect.  The message names the key and the demangled type that
was requested (and the type actually stored for a mismatch). */
class MetadataGetError : public SeisRespError
{
public:
  MetadataGetError():SeisRespError(){};
  /*! Key not found.  Texpected is a typeid name. */
  MetadataGetError(const std::string key,const char *Texpected)
    : SeisRespError(std::string("Metadata get failed:  key=")+key
        +" is not defined (requested type "
        +boost::core::demangle(Texpected)+")",ErrorSeverity::Suspect)
  {
  };
  /*! Key found but the stored value is not of the requested type. */
  MetadataGetError(const std::string key,const char *Texpected,
      const char *Tactual)
    : SeisRespError(std::string("Metadata get failed:  key=")+key
        +" holds a value of type "+boost::core::demangle(Tactual)
        +" that cannot be returned as "+boost::core::demangle(Texpected),
        ErrorSeverity::Suspect)
  {
  };
};

/*! \brief Typed key-value container built on boost::any.

This is the in-memory form of a parameter file.  The get_ methods of
the BasicMetadata interface accept a few compatible stored types (an
int where a double is requested for example) because a parameter file
parser cannot know the type a caller expects. */
class Metadata : public BasicMetadata
{
public:
  Metadata(){};
  Metadata(const Metadata& mdold);
  virtual ~Metadata(){};
  Metadata& operator=(const Metadata& mdold);
  /*! Copy every attribute of rhs replacing any with the same key.

  Used to merge parameter files read along a search path where later
  files override earlier ones. */
  Metadata& operator+=(const Metadata& rhs) noexcept;
  /*! Accepts double, float, or int entries. */
  double get_double(const std::string key) const override
  {
    return this->get_converted<double,double,float,int,long>(key);
  };
  /*! Accepts int or long entries. */
  int get_int(const std::string key) const override
  {
    return this->get_converted<int,int,long>(key);
  };
  long get_long(const std::string key) const
  {
    return this->get_converted<long,long,int>(key);
  };
  std::string get_string(const std::string key) const override
  {
    return this->get<std::string>(key);
  };
  bool get_bool(const std::string key) const override
  {
    return this->get<bool>(key);
  };
  /*! Generic get.  The stored type must be exactly T.

  \exception MetadataGetError (Suspect) for a missing key or a type
    mismatch.
  */
  template <typename T> T get(const std::string key) const
  {
    return this->get_converted<T,T>(key);
  };
  /*! Return the raw container.

  \exception MetadataGetError if key is not defined. */
  boost::any get_any(const std::string key) const
  {
    return this->lookup(key,typeid(boost::any).name());
  };
  /*! Demangled type name of the value stored with key. */
  std::string type(const std::string key) const;
  template <typename T> void put(const std::string key, T val) noexcept
  {
    md[key]=boost::any(val);
  }
  template <typename T> void put(const char *key, T val) noexcept
  {
    md[std::string(key)]=boost::any(val);
  }
  void put(const std::string key, const double val) override
  {
    this->put<double>(key,val);
  };
  void put(const std::string key, const int val) override
  {
    this->put<int>(key,val);
  };
  void put(const std::string key, const bool val) override
  {
    this->put<bool>(key,val);
  };
  void put(const std::string key, const std::string val) override
  {
    this->put<std::string>(key,val);
  };
  std::set<std::string> keys() const noexcept;
  bool is_defined(const std::string key) const noexcept;
  /*! Remove key.  A key that is not defined is silently ignored. */
  void erase(const std::string key);
  std::size_t size() const noexcept;
  friend std::ostream& operator<<(std::ostream&, const Metadata&);
protected:
  std::map<std::string,boost::any> md;
private:
  const boost::any& lookup(const std::string& key,const char *Texpected) const
  {
    std::map<std::string,boost::any>::const_iterator iptr=md.find(key);
    if(iptr==md.end())
      throw MetadataGetError(key,Texpected);
    return iptr->second;
  };
  /* Try each stored type in Alt in order and cast the first match to R */
  template <typename R, typename T, typename... Alt>
  static bool cast_first(const boost::any& a, R& out)
  {
    const T *p=boost::any_cast<T>(&a);
    if(p!=nullptr)
    {
      out=static_cast<R>(*p);
      return true;
    }
    if constexpr (sizeof...(Alt)>0)
      return cast_first<R,Alt...>(a,out);
    else
      return false;
  };
  template <typename R, typename... Alt>
  R get_converted(const std::string& key) const
  {
    const boost::any& a=this->lookup(key,typeid(R).name());
    R result;
    if(!cast_first<R,Alt...>(a,result))
      throw MetadataGetError(key,typeid(R).name(),a.type().name());
    return result;
  };
};
/*! Demangled name of the type held in val. */
std::string demangled_name(const boost::any val);
}
#endif

#include <string>
#include <boost/core/demangle.hpp>
#include "seisresp/utility/Metadata.h"
namespace seisresp::utility
{
using namespace std;

Metadata::Metadata(const Metadata& parent) : md(parent.md)
{
}
Metadata& Metadata::operator=(const Metadata& parent)
{
  if(this!=(&parent)) md=parent.md;
  return *this;
}
Metadata& Metadata::operator+=(const Metadata& rhs) noexcept
{
  if(this==(&rhs)) return *this;
  for(auto& kv : rhs.md) md[kv.first]=kv.second;
  return *this;
}
bool Metadata::is_defined(const string key) const noexcept
{
  return md.count(key)>0;
}
set<string> Metadata::keys() const noexcept
{
  set<string> result;
  for(auto& kv : md) result.insert(kv.first);
  return result;
}
void Metadata::erase(const string key)
{
  md.erase(key);
}
size_t Metadata::size() const noexcept
{
  return md.size();
}
string demangled_name(const boost::any a)
{
  return boost::core::demangle(a.type().name());
}
string Metadata::type(const string key) const
{
  return demangled_name(this->get_any(key));
}
/* One line per key:  key type value.  Types a parameter file cannot
produce print as NONPRINTABLE. */
ostream& operator<<(ostream& os, const Metadata& m)
{
  for(auto& kv : m.md)
  {
    const boost::any& a=kv.second;
    const type_info& ti=a.type();
    os<<kv.first<<" ";
    if(ti==typeid(int))
      os<<"int "<<boost::any_cast<int>(a);
    else if(ti==typeid(long))
      os<<"long "<<boost::any_cast<long>(a);
    else if(ti==typeid(double))
      os<<"double "<<boost::any_cast<double>(a);
    else if(ti==typeid(bool))
      os<<"bool "<<boost::any_cast<bool>(a);
    else if(ti==typeid(string))
      os<<"string "<<boost::any_cast<string>(a);
    else
      os<<demangled_name(a)<<" NONPRINTABLE";
    os<<endl;
  }
  return os;
}
}

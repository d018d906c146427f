#ifndef _SEISRESP_ANTELOPE_PF_H_
#define _SEISRESP_ANTELOPE_PF_H_

#include <list>
#include <map>
#include <string>
#include "seisresp/utility/Metadata.h"
namespace seisresp::utility{
/*! \brief Parameter file in the Antelope pf format.

Simple key-value lines are posted to the Metadata base with a type
guessed from the text:  digits with a period or exponent are double,
digits alone are int, yes/no style words are bool, and anything else
is a string (so a date like 2010,001 stays a string).  A &Tbl{ block
becomes a list of its lines and a nested &Arr{ block becomes another
AntelopePf fetched with get_branch.

Processing parameters and instrument descriptors are normally fed to
the simulation engine this way, e.g.

  water_level 60.0
  pre_filter &Tbl{
  0.005 0.006 30.0 35.0
  }
  paz_remove &Arr{
  gain 0.4
  poles &Tbl{
  -4.44 4.44
  -4.44 -4.44
  }
  zeros &Tbl{
  0.0 0.0
  0.0 0.0
  }
  }
*/
class AntelopePf : public Metadata
{
public:
    AntelopePf():Metadata(){};
    /*! \brief Read pfbase along PFPATH.

    Every readable file pfbase.pf in the colon separated PFPATH
    directories is read in order and later files override earlier
    ones.  Without PFPATH, or when pfbase is an absolute path, pfbase is
    read as given (with .pf appended as a second try).

    \exception SeisRespError (Invalid) if no file could be read.
    */
    AntelopePf(std::string pfbase);
    /*! Parse pf text held one line per list entry. */
    AntelopePf(std::list<std::string> lines);
    AntelopePf(const AntelopePf& parent);
    /*! Lines of the Tbl key with blank and comment lines removed.
      Throws AntelopePfError if key is not a Tbl. */
    std::list<std::string> get_tbl(const std::string key) const;
    /*! Copy of the nested Arr key.  Throws AntelopePfError if key is
      not an Arr. */
    AntelopePf get_branch(const std::string key) const;
    std::list<std::string> arr_keys() const;
    std::list<std::string> tbl_keys() const;
    /*! Return true if a Tbl is defined with this key. */
    bool has_tbl(const std::string key) const
    {
      return pftbls.find(key)!=pftbls.end();
    };
    /*! Return true if an Arr is defined with this key. */
    bool has_branch(const std::string key) const
    {
      return pfbranches.find(key)!=pfbranches.end();
    };
    /*! \brief Get a simple parameter as a string.

      Numeric and boolean values are stored by their guessed type, but
      the text as written in the pf is retained as well.  This returns
      that text when the stored value is not a string, so a value like
      00 can be fetched without losing its leading zero.

      \exception MetadataGetError if key is not defined.
      */
    std::string get_string(const std::string key) const override;
    AntelopePf& operator=(const AntelopePf& parent);
    /*! Write the contents in pf format.  pfread of the output gives
      back the same contents. */
    void pfwrite(std::ostream& ofs) const;
private:
    std::map<std::string,std::list<std::string> > pftbls;
    std::map<std::string, AntelopePf> pfbranches;
    /* Text of every simple parameter as written in the pf */
    std::map<std::string,std::string> pfstrings;
    /* Overlay m on this.  Returns the number of Tbl and Arr items
    copied. */
    int merge_pfmf(AntelopePf& m);
};
/*! Parse or lookup failure in an AntelopePf.  Always Invalid. */
class AntelopePfError : public SeisRespError
{
    public:
        AntelopePfError()
          : SeisRespError(std::string("AntelopePfError->undefined error"),
              ErrorSeverity::Invalid){};
        AntelopePfError(std::string mess)
          : SeisRespError(std::string("AntelopePfError object message=")+mess,
              ErrorSeverity::Invalid){};
        AntelopePfError(const char *mess)
          : SeisRespError(std::string("AntelopePfError object message=")+mess,
              ErrorSeverity::Invalid){};
};
/*! \brief Read a pf file by name.

No PFPATH search is done.  This is the low level reader used by the
name constructor.

\exception SeisRespError if the file does not exist or cannot be opened.
*/
AntelopePf pfread(const std::string fname);

} // End seisresp::utility namespace declaration
#endif

/* Parzip - Parallel zip archiver
   Copyright (C) 2026 The parzip developers.

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 2 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

/* Command-line parser. Options are recognized in any position unless
   in_order is true. An argument "--" ends the options; everything after
   it is a non-option argument.

   Short options may be grouped ("-vvx"). The argument of a short option
   follows it in the same word ("-n4") or in the next one ("-n 4").
   Long options may be abbreviated to any unambiguous prefix; their
   argument follows them after a '=' ("--threads=4") or in the next word.
   Options of type 'maybe' only take an argument written in the same word.

   The results are stored in order. For each option, code is its code and
   argument its argument, if any. For each non-option argument, code is 0
   and argument is the argument itself. */

class Arg_parser
  {
public:
  enum Has_arg { no, yes, maybe };

  struct Option
    {
    int code;			// Short option letter or code ( code != 0 )
    const char * long_name;	// Long option name (maybe null)
    Has_arg has_arg;
    };

private:
  struct Record
    {
    int code;
    std::string parsed_name;
    std::string argument;
    explicit Record( const int c = 0 ) : code( c ) {}
    Record( const int c, const char * const long_name )
      : code( c ), parsed_name( "--" ) { parsed_name += long_name; }
    explicit Record( const char * const arg ) : code( 0 ), argument( arg ) {}
    void set_argument_from( const char * const arg ) { argument = arg; }
    };

  std::string error_;
  std::vector< Record > data;

  bool parse_long_option( const char * const opt, const char * const arg,
                          const Option options[], int & argind );
  bool parse_short_option( const char * const opt, const char * const arg,
                           const Option options[], int & argind );

public:
  Arg_parser( const int argc, const char * const argv[],
              const Option options[], const bool in_order = false );

  const std::string & error() const { return error_; }

  // The number of arguments parsed. May be different from argc.
  int arguments() const { return data.size(); }

  /* If code( i ) is 0, argument( i ) is a non-option.
     Else argument( i ) is the option's argument (or empty). */
  int code( const int i ) const
    {
    if( i >= 0 && i < arguments() ) return data[i].code;
    else return 0;
    }

  // Full name of the option parsed (short or long).
  const std::string & parsed_name( const int i ) const
    {
    if( i >= 0 && i < arguments() ) return data[i].parsed_name;
    else return error_;
    }

  const std::string & argument( const int i ) const
    {
    if( i >= 0 && i < arguments() ) return data[i].argument;
    else return error_;
    }
  };

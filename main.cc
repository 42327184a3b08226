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
/*
   Exit status: 0 for a normal exit, 1 for environmental problems
   (file not found, invalid command-line options, I/O errors, etc), 2 to
   indicate a corrupt or invalid archive or an entry name pointing outside
   of the destination directory, 3 for an internal consistency error
   (e.g., bug) which caused parzip to panic.
*/

#define _FILE_OFFSET_BITS 64

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <ctime>
#include <strings.h>
#include <unistd.h>
#include <sys/stat.h>
#include <zlib.h>

#include "parzip.h"
#include "arg_parser.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_index.h"
#include "zip_writer.h"
#include "create.h"
#include "decode.h"

#if CHAR_BIT != 8
#error "Environments where CHAR_BIT != 8 are not supported."
#endif


namespace {

const char * const program_year = "2026";
const char * invocation_name = program_name;		// default value


void show_help( const long num_online )
  {
  std::printf(
    "Parzip is a parallel (multithreaded) zip archiver. Parzip uses the\n"
    "compression library zlib.\n"
    "\nWhen creating an archive, parzip prepares the entries of the directory\n"
    "tree in parallel and writes them to the archive in sorted name order, so\n"
    "that the same tree always produces the same archive. When extracting,\n"
    "parzip restores the files in parallel under a limit of files open at the\n"
    "same time, and refuses to write outside of the destination directory.\n"
    "\nUsage: %s operation [options] <file>\n", invocation_name );
  std::printf( "\nOperations:\n"
    "  -h, --help                  display this help and exit\n"
    "  -V, --version               output version information and exit\n"
    "  -c, --create                create a zip archive from the file or directory\n"
    "  -t, --list                  list the contents of an archive\n"
    "  -x, --extract               extract all the files from an archive\n"
    "\nOptions:\n"
    "  -d, --dest=<dir>            extract to <dir> [archive name without .zip]\n"
    "  -n, --threads=<n>           set number of worker threads [%ld]\n"
    "  -o, --output=<archive>      create <archive> [file name + .zip]\n"
    "  -p, --preserve-permissions  don't subtract the umask on extraction\n"
    "  -q, --quiet                 suppress all messages\n"
    "  -v, --verbose               verbosely list files processed\n"
    "  -0 .. -9                    set compression level [default 6]\n"
    "      --exclude=<pattern>     exclude files matching a shell pattern\n"
    "      --keep-damaged          don't delete partially extracted files\n"
    "      --mtime=<date>          use <date> as mtime for files added to archive\n"
    "      --out-slots=<n>         number of prepared entries buffered [2 x n]\n"
    "      --permits=<n>           max number of files extracted at once [%ld]\n",
    num_online, num_online );
  if( verbosity >= 1 ) std::fputs(
    "      --debug=<level>         (0-1) print debug statistics to stderr\n", stdout );
  std::fputs(
    "\n<date> may be '@<seconds since the epoch>', 'YYYY-MM-DD[ HH:MM:SS]', or\n"
    "the name of a reference file starting with '.' or '/'.\n"
    "\n*Exit status*\n"
    "0 for a normal exit, 1 for environmental problems (file not found,\n"
    "invalid command-line options, I/O errors, etc), 2 to indicate a corrupt\n"
    "or invalid archive, 3 for an internal consistency error (e.g., bug) which\n"
    "caused parzip to panic.\n", stdout );
  }


void show_version()
  {
  std::printf( "%s %s\n", program_name, PROGVERSION );
  std::printf( "Copyright (C) %s The parzip developers.\n", program_year );
  std::fputs( "License GPLv2+: GNU GPL version 2 or later <http://gnu.org/licenses/gpl.html>\n"
              "This is free software: you are free to change and redistribute it.\n"
              "There is NO WARRANTY, to the extent permitted by law.\n", stdout );
  std::printf( "Using zlib %s\n", zlibVersion() );
  }


void show_option_error( const char * const arg, const char * const msg,
                        const char * const option_name )
  {
  if( verbosity >= 0 )
    std::fprintf( stderr, "%s: '%s': %s option '%s'.\n",
                  program_name, arg, msg, option_name );
  }


long long getnum( const char * const arg, const char * const option_name,
                  const long long llimit = LLONG_MIN,
                  const long long ulimit = LLONG_MAX )
  {
  char * tail;
  errno = 0;
  const long long result = std::strtoll( arg, &tail, 0 );
  if( tail == arg || *tail )
    { show_option_error( arg, "Bad or missing numerical argument in",
                         option_name ); std::exit( 1 ); }
  if( !errno && ( result < llimit || result > ulimit ) ) errno = ERANGE;
  if( errno )
    {
    if( verbosity >= 0 )
      std::fprintf( stderr, "%s: '%s': Value out of limits [%lld,%lld] in "
                    "option '%s'.\n", program_name, arg, llimit, ulimit,
                    option_name );
    std::exit( 1 );
    }
  return result;
  }


void set_mode( Program_mode & program_mode, const Program_mode new_mode )
  {
  if( program_mode != m_none && program_mode != new_mode )
    {
    show_error( "Only one operation can be specified.", 0, true );
    std::exit( 1 );
    }
  program_mode = new_mode;
  }


// parse time as 'long long' even if time_t is 32-bit
long long parse_mtime( const char * arg, const char * const pn )
  {
  if( *arg == '@' ) return getnum( arg + 1, pn );  // seconds since the epoch
  if( *arg == '.' || *arg == '/' )
    {
    struct stat st;
    if( stat( arg, &st ) == 0 ) return st.st_mtime;
    show_file_error( arg, "Can't stat mtime reference file", errno );
    std::exit( 1 );
    }
  long long y;		// format 'YYYY-MM-DD[[[<separator>HH]:MM]:SS]'
  unsigned mo, d, h, m, s;
  char sep;
  const int n = std::sscanf( arg, "%lld-%u-%u%c%u:%u:%u",
                             &y, &mo, &d, &sep, &h, &m, &s );
  if( n >= 3 && n <= 7 && n != 4 && ( n == 3 || sep == ' ' || sep == 'T' ) )
    {
    if( y >= 1970 && y <= INT_MAX && mo >= 1 && mo <= 12 )
      {
      struct tm t;
      t.tm_year = y - 1900; t.tm_mon = mo - 1; t.tm_mday = d;
      t.tm_hour = ( n >= 5 ) ? h : 0; t.tm_min = ( n >= 6 ) ? m : 0;
      t.tm_sec = ( n >= 7 ) ? s : 0; t.tm_isdst = -1; t.tm_wday = -1;
      const long long mtime = std::mktime( &t );
      if( mtime != -1 || t.tm_wday != -1 ) return mtime;	// valid mtime
      }
    show_option_error( arg, "Date out of limits in", pn ); std::exit( 1 );
    }
  show_option_error( arg, "Unknown date format in", pn ); std::exit( 1 );
  }


// extension of the last component of name, including the dot
std::string extension( const std::string & name )
  {
  const unsigned long i = name.rfind( '.' );
  if( i == std::string::npos ) return std::string();
  return name.substr( i );
  }


// file name + ".zip"
std::string default_archive_name( const std::string & source )
  {
  const std::string base( base_name( clean_path( source ) ) );
  if( base == "." || base == ".." || base == "/" ) return "archive.zip";
  return base + ".zip";
  }


// archive name without ".zip" and without one more extension, if any
std::string default_dest_dir( const std::string & archive )
  {
  std::string base( base_name( archive ) );
  if( strcasecmp( extension( base ).c_str(), ".zip" ) == 0 )
    base.resize( base.size() - 4 );
  base.resize( base.size() - extension( base ).size() );
  if( base.empty() ) base = ".";
  return base;
  }


// check that the input exists before calling the core
bool check_input( const std::string & name )
  {
  struct stat st;
  if( stat( name.c_str(), &st ) == 0 ) return true;
  show_file_error( name.c_str(), "Can't access input", errno );
  return false;
  }


int report( const Op_error & error )
  {
  if( error.ok() ) return 0;
  if( verbosity >= 0 && error.msg.size() )
    std::fputs( error.msg.c_str(), stderr );
  return error.retval ? error.retval : 1;
  }

} // end namespace


int main( const int argc, const char * const argv[] )
  {
  if( argc > 0 ) invocation_name = argv[0];

  enum { opt_dbg = 256, opt_exc, opt_kd, opt_mti, opt_out, opt_per };
  const Arg_parser::Option options[] =
    {
    { '0', 0,                      Arg_parser::no  },
    { '1', 0,                      Arg_parser::no  },
    { '2', 0,                      Arg_parser::no  },
    { '3', 0,                      Arg_parser::no  },
    { '4', 0,                      Arg_parser::no  },
    { '5', 0,                      Arg_parser::no  },
    { '6', 0,                      Arg_parser::no  },
    { '7', 0,                      Arg_parser::no  },
    { '8', 0,                      Arg_parser::no  },
    { '9', 0,                      Arg_parser::no  },
    { 'c', "create",               Arg_parser::no  },
    { 'd', "dest",                 Arg_parser::yes },
    { 'h', "help",                 Arg_parser::no  },
    { 'n', "threads",              Arg_parser::yes },
    { 'o', "output",               Arg_parser::yes },
    { 'p', "preserve-permissions", Arg_parser::no  },
    { 'q', "quiet",                Arg_parser::no  },
    { 't', "list",                 Arg_parser::no  },
    { 'v', "verbose",              Arg_parser::no  },
    { 'V', "version",              Arg_parser::no  },
    { 'x', "extract",              Arg_parser::no  },
    { opt_dbg, "debug",            Arg_parser::yes },
    { opt_exc, "exclude",          Arg_parser::yes },
    { opt_kd,  "keep-damaged",     Arg_parser::no  },
    { opt_mti, "mtime",            Arg_parser::yes },
    { opt_out, "out-slots",        Arg_parser::yes },
    { opt_per, "permits",          Arg_parser::yes },
    { 0, 0,                        Arg_parser::no  } };

  const Arg_parser parser( argc, argv, options );
  if( parser.error().size() )				// bad option
    { show_error( parser.error().c_str(), 0, true ); return 1; }

  const long num_online = std::max( 1L, sysconf( _SC_NPROCESSORS_ONLN ) );
  long max_workers = sysconf( _SC_THREAD_THREADS_MAX );
  if( max_workers < 1 || max_workers > INT_MAX / (int)sizeof (pthread_t) )
    max_workers = INT_MAX / sizeof (pthread_t);

  Program_mode program_mode = m_none;
  Pack_options pack_opts;
  Unpack_options unpack_opts;
  std::string input, output, dest;
  int num_workers = 0;			// 0 = number of online processors
  int debug_level = 0;
  for( int argind = 0; argind < parser.arguments(); ++argind )
    {
    const int code = parser.code( argind );
    const std::string & sarg = parser.argument( argind );
    if( !code )					// non-option
      {
      if( sarg.empty() )
        { show_error( "Empty non-option argument." ); return 1; }
      if( input.size() )
        { show_error( "Only one file can be specified.", 0, true ); return 1; }
      input = sarg; continue;
      }
    const char * const arg = sarg.c_str();
    const char * const pn = parser.parsed_name( argind ).c_str();
    switch( code )
      {
      case '0': case '1': case '2': case '3': case '4':
      case '5': case '6': case '7': case '8': case '9':
                pack_opts.level = code - '0'; break;
      case 'c': set_mode( program_mode, m_create ); break;
      case 'd': dest = sarg; break;
      case 'h': show_help( num_online ); return 0;
      case 'n': num_workers = getnum( arg, pn, 1, max_workers ); break;
      case 'o': output = sarg; break;
      case 'p': unpack_opts.preserve_permissions = true; break;
      case 'q': verbosity = -1; break;
      case 't': set_mode( program_mode, m_list ); break;
      case 'v': if( verbosity < 4 ) ++verbosity; break;
      case 'V': show_version(); return 0;
      case 'x': set_mode( program_mode, m_extract ); break;
      case opt_dbg: debug_level = getnum( arg, pn, 0, 3 ); break;
      case opt_exc: pack_opts.exclude_patterns.push_back( sarg ); break;
      case opt_kd:  unpack_opts.keep_damaged = true; break;
      case opt_mti: pack_opts.mtime = parse_mtime( arg, pn );
                    pack_opts.mtime_set = true; break;
      case opt_out: pack_opts.out_slots = getnum( arg, pn, 1, 1024 ); break;
      case opt_per: unpack_opts.num_permits = getnum( arg, pn, 1, 1024 );
                    break;
      default: internal_error( "uncaught option." );
      }
    } // end process options

  if( program_mode == m_none )
    { show_error( "Missing operation.", 0, true ); return 1; }
  if( input.empty() )
    { show_error( "Missing file name.", 0, true ); return 1; }
  if( !check_input( input ) ) return 1;

  switch( program_mode )
    {
    case m_none: break;
    case m_create:
      {
      pack_opts.source = input;
      pack_opts.archive = output.size() ? output : default_archive_name( input );
      pack_opts.num_workers = num_workers;
      pack_opts.debug_level = debug_level;
      const int retval = report( pack_archive( pack_opts ) );
      if( retval == 0 && verbosity >= 0 )
        std::printf( "Archive created: %s\n", pack_opts.archive.c_str() );
      return retval;
      }
    case m_extract:
      {
      tzset();
      unpack_opts.archive = input;
      unpack_opts.dest = dest.size() ? dest : default_dest_dir( input );
      unpack_opts.num_workers = num_workers;
      unpack_opts.debug_level = debug_level;
      const int retval = report( unpack_archive( unpack_opts ) );
      if( retval == 0 && verbosity >= 0 )
        std::printf( "Extracted to: %s\n", unpack_opts.dest.c_str() );
      return retval;
      }
    case m_list: tzset(); return list_archive( input );
    }
  return 0;
  }

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

#include <climits>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <stdint.h>
#include <sys/types.h>


class Resizable_buffer
  {
  char * p;
  unsigned long size_;			// size_ < LONG_MAX

  Resizable_buffer( const Resizable_buffer & );	// declared as private
  void operator=( const Resizable_buffer & );	// declared as private

public:
  enum { default_initial_size = 1024 };

  explicit Resizable_buffer( const unsigned long initial_size =
                             default_initial_size )
    : p( (char *)std::malloc( initial_size ) ), size_( p ? initial_size : 0 ) {}
  ~Resizable_buffer() { if( p ) std::free( p ); p = 0; size_ = 0; }

  bool resize( const unsigned long long new_size )
    {
    if( new_size >= LONG_MAX ) return false;
    if( size_ < new_size )
      {
      char * const tmp = (char *)std::realloc( p, new_size );
      if( !tmp ) return false;
      p = tmp; size_ = new_size;
      }
    return true;
    }
  char * operator()() { return p; }		// no need for operator[]
  const char * operator()() const { return p; }
  uint8_t * u8() { return (uint8_t *)p; }
  const uint8_t * u8() const { return (const uint8_t *)p; }
  unsigned long size() const { return size_; }
  };


inline bool dotdot_at_i( const char * const filename, const int i )
  {
  return filename[i] == '.' && filename[i+1] == '.' &&
         ( i == 0 || filename[i-1] == '/' ) &&
         ( filename[i+2] == 0 || filename[i+2] == '/' );
  }


enum Program_mode { m_none, m_create, m_extract, m_list };

/* Kinds of failure of a whole pack or unpack operation. Only the first
   error found (by sequence when packing) is reported. */
enum Error_kind { ek_none, ek_traversal, ek_prepare, ek_write,
                  ek_path_escape, ek_restore };

struct Op_error
  {
  Error_kind kind;
  int retval;		// 0 = OK, 1 = I/O error, 2 = corrupt or invalid archive
  std::string msg;	// preformatted and newline terminated, may be empty

  Op_error() : kind( ek_none ), retval( 0 ) {}
  void set( const Error_kind k, const int r, const std::string & m )
    { kind = k; retval = r; msg = m; }
  bool ok() const { return kind == ek_none; }
  };

const char * const mem_msg = "Not enough memory.";
const char * const end_msg = "Archive ends unexpectedly.";
const char * const cant_stat = "Can't stat input file";
const char * const eclosa_msg = "Error closing archive";
const char * const eclosf_msg = "Error closing file";
const char * const rd_open_msg = "Can't open for reading";
const char * const rd_err_msg = "Read error";
const char * const wr_err_msg = "Write error";
const char * const intdir_msg = "Failed to create intermediate directory";
const char * const mkdir_msg = "Can't create directory";
const char * const escape_msg =
  "Entry name points outside of the destination directory.";
const char * const itself_msg = "Archive can't contain itself; not dumped.";
const char * const conofin_msg = "courier not finished.";

// defined in common.cc
extern int verbosity;
extern const char * const program_name;
long readblock( const int fd, uint8_t * const buf, const long size );
int writeblock( const int fd, const uint8_t * const buf, const int size );
int preadblock( const int fd, uint8_t * const buf, const int size,
                const long long pos );
const char * format_num3( unsigned long long num, const bool negative = false );
int open_instream( const char * const name, std::string * const estrp = 0 );
int open_outstream( const std::string & name, std::string * const estrp = 0 );
void show_error( const char * const msg, const int errcode = 0,
                 const bool help = false );
void print_error( const int errcode, const char * const format, ... );
void format_file_error( std::string & estr, const char * const filename,
                        const char * const msg, const int errcode = 0 );
void show_file_error( const char * const filename, const char * const msg,
                      const int errcode = 0 );
void internal_error( const char * const msg );

// defined in common_decode.cc
std::string clean_path( const std::string & path );
std::string base_name( const std::string & path );
std::string dir_name( const std::string & path );
bool check_inside( const std::string & root, const std::string & target );
int gate_path( const std::string & root, const std::string & name,
               std::string & target, std::string & estr );
bool make_dirs( const std::string & name );
bool make_dir_path( const std::string & dirname );
const char * remove_leading_dotslash( const char * const filename,
             std::string * const removed_prefixp, const bool dotdot = false );
mode_t get_umask();
enum { mode_string_size = 10 };
void format_mode_string( const unsigned mode, char buf[mode_string_size] );

// defined in common_mutex.cc
void exit_fail_mt( const int retval = 1 );	// terminate the program
bool print_removed_prefix( const std::string & prefix,
                           std::string * const msgp = 0 );

// defined in exclude.cc
namespace Exclude {
bool excluded( const std::vector< std::string > & patterns,
               const char * const filename );
} // end namespace Exclude

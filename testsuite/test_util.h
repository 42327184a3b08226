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

// Helpers shared by the tests. Include after the standard headers.

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <ftw.h>
#include <unistd.h>
#include <sys/stat.h>

namespace test_util {

inline int remove_one( const char * const filename, const struct stat *,
                       const int, struct FTW * )
  { return std::remove( filename ) == 0 ? 0 : -1; }


// Directory created under $TMPDIR and removed with all its contents.
class Temp_dir
  {
  std::string path_;

  Temp_dir( const Temp_dir & );			// declared as private
  void operator=( const Temp_dir & );		// declared as private

public:
  Temp_dir()
    {
    const char * tmpdir = std::getenv( "TMPDIR" );
    if( !tmpdir || !tmpdir[0] ) tmpdir = "/tmp";
    std::string templ( tmpdir ); templ += "/parzip_test.XXXXXX";
    std::vector< char > buf( templ.begin(), templ.end() );
    buf.push_back( 0 );
    if( mkdtemp( &buf[0] ) ) path_ = &buf[0];
    }
  ~Temp_dir()
    {
    if( path_.empty() ) return;
    chmod( path_.c_str(), 0755 );
    nftw( path_.c_str(), remove_one, 16, FTW_DEPTH | FTW_PHYS );
    }

  bool ok() const { return !path_.empty(); }
  const std::string & path() const { return path_; }
  std::string operator()( const std::string & name ) const
    { return path_ + '/' + name; }
  };


inline bool write_file( const std::string & name, const std::string & data,
                        const mode_t mode = 0644 )
  {
  if( !make_dirs( name ) ) return false;
  const int fd = open( name.c_str(), O_CREAT | O_WRONLY | O_TRUNC, mode );
  if( fd < 0 ) return false;
  const bool ok = writeblock( fd, (const uint8_t *)data.data(), data.size() ) ==
                  (int)data.size();
  if( fchmod( fd, mode ) != 0 ) { close( fd ); return false; }
  return close( fd ) == 0 && ok;
  }


inline std::string read_file( const std::string & name )
  {
  std::string data;
  const int fd = open( name.c_str(), O_RDONLY );
  if( fd < 0 ) return data;
  uint8_t buf[4096];
  while( true )
    {
    const long rd = readblock( fd, buf, sizeof buf );
    data.append( (const char *)buf, rd );
    if( rd < (long)sizeof buf ) break;
    }
  close( fd );
  return data;
  }


inline bool exists( const std::string & name )
  { struct stat st; return lstat( name.c_str(), &st ) == 0; }

inline bool is_dir( const std::string & name )
  { struct stat st; return stat( name.c_str(), &st ) == 0 && S_ISDIR( st.st_mode ); }

inline unsigned file_perm( const std::string & name )
  {
  struct stat st;
  return ( stat( name.c_str(), &st ) == 0 ) ? st.st_mode & 07777 : 0;
  }


// Data that compresses unevenly, so that entries differ in timing and size.
inline std::string make_data( const unsigned seed, const unsigned size )
  {
  std::string data;
  data.reserve( size );
  unsigned x = seed * 2654435761U + 1;
  for( unsigned i = 0; i < size; ++i )
    {
    x = x * 1103515245U + 12345U;
    data += ( i % 7 == 0 ) ? (char)( x >> 16 ) : (char)( 'a' + i % 23 );
    }
  return data;
  }

} // end namespace test_util

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

#include <ctime>
#include <sys/stat.h>

/* Layout of the records of a PKWARE zip archive (APPNOTE 6.3).
   All the multibyte fields are little endian. */

enum {
  lh_size = 30,			// local file header
  cdh_size = 46,		// central directory file header
  eocd_size = 22,		// end of central directory record
  eocd64_size = 56,		// zip64 end of central directory record
  locator_size = 20,		// zip64 end of central directory locator
  dd_size = 16,			// data descriptor with signature
  dd64_size = 24,		// zip64 data descriptor with signature
  max_comment_size = 65535,
  xt_size = 9,			// extended timestamp extra field, mtime only
  xz_local_size = 20 };		// zip64 extra field of a local header

const uint32_t lh_magic     = 0x04034B50;	// "PK\3\4"
const uint32_t cdh_magic    = 0x02014B50;	// "PK\1\2"
const uint32_t eocd_magic   = 0x06054B50;	// "PK\5\6"
const uint32_t eocd64_magic = 0x06064B50;	// "PK\6\6"
const uint32_t locator_magic = 0x07064B50;	// "PK\6\7"
const uint32_t dd_magic     = 0x08074B50;	// "PK\7\8"

enum { method_store = 0, method_deflate = 8 };
enum { flag_encrypted = 1 << 0, flag_descriptor = 1 << 3,
       flag_utf8 = 1 << 11 };
enum { host_dos = 0, host_unix = 3 };
enum { version_default = 20, version_zip64 = 45,
       version_made = ( host_unix << 8 ) | 30 };
enum { xf_zip64 = 0x0001, xf_timestamp = 0x5455 };
enum { dos_dir_attr = 0x10, dos_rdonly_attr = 0x01 };

const uint32_t max16 = 0xFFFF;
const uint32_t max32 = 0xFFFFFFFFU;


inline unsigned get_le16( const uint8_t * const p )
  { return p[0] | ( p[1] << 8 ); }

inline uint32_t get_le32( const uint8_t * const p )
  { return p[0] | ( p[1] << 8 ) | ( p[2] << 16 ) | ( (uint32_t)p[3] << 24 ); }

inline unsigned long long get_le64( const uint8_t * const p )
  {
  unsigned long long tmp = 0;
  for( int i = 7; i >= 0; --i ) { tmp <<= 8; tmp += p[i]; }
  return tmp;
  }

inline void put_le16( std::vector< uint8_t > & v, const unsigned val )
  { v.push_back( val & 0xFF ); v.push_back( ( val >> 8 ) & 0xFF ); }

inline void put_le32( std::vector< uint8_t > & v, const uint32_t val )
  { for( int i = 0; i < 4; ++i ) v.push_back( ( val >> ( 8 * i ) ) & 0xFF ); }

inline void put_le64( std::vector< uint8_t > & v,
                      const unsigned long long val )
  { for( int i = 0; i < 8; ++i ) v.push_back( ( val >> ( 8 * i ) ) & 0xFF ); }


// metadata of one entry, as written to or read from the central directory
struct Zip_header
  {
  std::string name;		// directories end with '/'
  long long mtime;		// seconds since the epoch
  unsigned long long csize;	// compressed size
  unsigned long long usize;	// uncompressed size
  unsigned long long offset;	// position of the local header
  uint32_t crc;
  unsigned mode;		// file type and permission bits, like st_mode
  unsigned method;
  unsigned flags;

  Zip_header()
    : mtime( 0 ), csize( 0 ), usize( 0 ), offset( 0 ), crc( 0 ),
      mode( 0 ), method( method_store ), flags( 0 ) {}

  bool isdir() const
    { return S_ISDIR( mode ) ||
             ( !name.empty() && name[name.size()-1] == '/' ); }
  unsigned perm() const { return mode & 07777; }
  };


// MS-DOS date and time in local time. Date in the high 16 bits.
inline uint32_t dos_datetime( const long long mtime )
  {
  const time_t t = mtime;
  struct tm tm;
  if( mtime < 315532800 || !localtime_r( &t, &tm ) || tm.tm_year < 80 )
    return (uint32_t)( 1 << 5 | 1 ) << 16;		// 1980-01-01 00:00:00
  if( tm.tm_year > 207 )				// 2107-12-31 23:59:58
    return (uint32_t)( ( 127 << 9 ) | ( 12 << 5 ) | 31 ) << 16 |
           ( 23 << 11 ) | ( 59 << 5 ) | 29;
  const uint32_t date = ( ( tm.tm_year - 80 ) << 9 ) |
                        ( ( tm.tm_mon + 1 ) << 5 ) | tm.tm_mday;
  const uint32_t dtime = ( tm.tm_hour << 11 ) | ( tm.tm_min << 5 ) |
                         ( tm.tm_sec / 2 );
  return ( date << 16 ) | dtime;
  }

inline long long parse_dos_datetime( const uint32_t datetime )
  {
  struct tm tm;
  std::memset( &tm, 0, sizeof tm );
  const unsigned date = datetime >> 16;
  tm.tm_year = ( date >> 9 ) + 80;
  tm.tm_mon = ( ( date >> 5 ) & 0x0F ) - 1;
  tm.tm_mday = date & 0x1F;
  tm.tm_hour = ( datetime >> 11 ) & 0x1F;
  tm.tm_min = ( datetime >> 5 ) & 0x3F;
  tm.tm_sec = ( datetime & 0x1F ) * 2;
  tm.tm_isdst = -1;
  return std::mktime( &tm );
  }

// extended timestamp stores a signed 32-bit time
inline int32_t clamp_time32( const long long mtime )
  {
  if( mtime > INT32_MAX ) return INT32_MAX;
  if( mtime < INT32_MIN ) return INT32_MIN;
  return mtime;
  }

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

#define _FILE_OFFSET_BITS 64

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <unistd.h>

#include "parzip.h"
#include "zip_format.h"
#include "zip_index.h"


namespace {

// set mode from the external attributes, as Unix or as MS-DOS attributes
unsigned decode_mode( const Zip_header & h, const unsigned version_made_by,
                      const uint32_t ext_attr )
  {
  const bool dirname = !h.name.empty() && h.name[h.name.size()-1] == '/';
  const unsigned umode = ext_attr >> 16;
  if( ( version_made_by >> 8 ) == host_unix && umode != 0 )
    {
    if( dirname ) return S_IFDIR | ( umode & 07777 );
    if( ( umode & S_IFMT ) == 0 ) return S_IFREG | umode;
    return umode;
    }
  if( dirname || ( ext_attr & dos_dir_attr ) ) return S_IFDIR | 0755;
  return S_IFREG | ( ( ext_attr & dos_rdonly_attr ) ? 0444 : 0644 );
  }


void parse_extra( Zip_header & h, const uint8_t * p, const unsigned size,
                  bool & have_time )
  {
  const uint8_t * const end = p + size;
  while( p + 4 <= end )
    {
    const unsigned tag = get_le16( p );
    const unsigned len = get_le16( p + 2 );
    const uint8_t * const data = p + 4;
    if( data + len > end ) break;
    if( tag == xf_zip64 )		// only the fields set to all ones
      {
      unsigned i = 0;
      if( h.usize == max32 && i + 8 <= len )
        { h.usize = get_le64( data + i ); i += 8; }
      if( h.csize == max32 && i + 8 <= len )
        { h.csize = get_le64( data + i ); i += 8; }
      if( h.offset == max32 && i + 8 <= len )
        { h.offset = get_le64( data + i ); i += 8; }
      }
    else if( tag == xf_timestamp && len >= 5 && ( data[0] & 1 ) )
      { h.mtime = (int32_t)get_le32( data + 1 ); have_time = true; }
    p = data + len;
    }
  }

} // end namespace


void Zip_index::set_errno_error( const char * const msg )
  {
  error_ = msg; error_ += std::strerror( errno );
  retval_ = 1;
  }

void Zip_index::set_num_error( const char * const msg, unsigned long long num )
  {
  char buf[80];
  snprintf( buf, sizeof buf, "%s %s", msg, format_num3( num ) );
  error_ = buf;
  retval_ = 2;
  }


/* Find the end of central directory record (and the zip64 one if it
   exists) and read the position and size of the central directory. */
bool Zip_index::find_end( const int infd, unsigned long long & cd_offset,
                          unsigned long long & cd_size,
                          unsigned long long & num_entries )
  {
  const int tail_size = std::min( insize, (long long)eocd_size + max_comment_size );
  const long long tail_pos = insize - tail_size;
  Resizable_buffer rbuf( tail_size );
  if( rbuf.size() < (unsigned long)tail_size )
    { error_ = mem_msg; retval_ = 1; return false; }
  if( preadblock( infd, rbuf.u8(), tail_size, tail_pos ) != tail_size )
    { set_errno_error( "Error reading end of central directory: " );
      return false; }
  const uint8_t * const buf = rbuf.u8();
  int i = tail_size - eocd_size;
  for( ; i >= 0; --i )
    if( get_le32( buf + i ) == eocd_magic &&
        i + eocd_size + get_le16( buf + i + 20 ) <= tail_size ) break;
  if( i < 0 )
    { error_ = "Not a zip archive. End of central directory not found.";
      retval_ = 2; return false; }
  const uint8_t * const eocd = buf + i;
  if( get_le16( eocd + 4 ) != 0 || get_le16( eocd + 6 ) != 0 )
    { error_ = "Multi-volume archives are not supported."; retval_ = 2;
      return false; }
  num_entries = get_le16( eocd + 10 );
  cd_size = get_le32( eocd + 12 );
  cd_offset = get_le32( eocd + 16 );

  const long long eocd_pos = tail_pos + i;
  if( eocd_pos < locator_size ) return true;
  uint8_t locator[locator_size];
  if( preadblock( infd, locator, locator_size, eocd_pos - locator_size ) !=
      locator_size )
    { set_errno_error( "Error reading zip64 locator: " ); return false; }
  if( get_le32( locator ) != locator_magic ) return true;	// not zip64
  const unsigned long long eocd64_pos = get_le64( locator + 8 );
  uint8_t eocd64[eocd64_size];
  if( eocd64_pos + eocd64_size > (unsigned long long)eocd_pos )
    { set_num_error( "Bad zip64 end record position", eocd64_pos );
      return false; }
  if( preadblock( infd, eocd64, eocd64_size, eocd64_pos ) != eocd64_size )
    { set_errno_error( "Error reading zip64 end record: " ); return false; }
  if( get_le32( eocd64 ) != eocd64_magic )
    { set_num_error( "Bad zip64 end record at pos", eocd64_pos );
      return false; }
  num_entries = get_le64( eocd64 + 32 );
  cd_size = get_le64( eocd64 + 40 );
  cd_offset = get_le64( eocd64 + 48 );
  return true;
  }


bool Zip_index::parse_central_directory( const uint8_t * const buf,
                                         const unsigned long long size,
                                         const unsigned long long num_entries,
                                         const unsigned long long cd_offset )
  {
  if( num_entries > size / cdh_size )
    { set_num_error( "Too many entries for central directory size:",
                     num_entries ); return false; }
  entry_vector.reserve( num_entries );
  unsigned long long pos = 0;
  for( unsigned long long n = 0; n < num_entries; ++n )
    {
    const uint8_t * const p = buf + pos;
    if( pos + cdh_size > size || get_le32( p ) != cdh_magic )
      { set_num_error( "Bad central directory header at pos",
                       cd_offset + pos ); return false; }
    const unsigned name_len = get_le16( p + 28 );
    const unsigned extra_len = get_le16( p + 30 );
    const unsigned comment_len = get_le16( p + 32 );
    if( pos + cdh_size + name_len + extra_len + comment_len > size )
      { set_num_error( "Truncated central directory header at pos",
                       cd_offset + pos ); return false; }
    Zip_header h;
    h.flags = get_le16( p + 8 );
    h.method = get_le16( p + 10 );
    const uint32_t datetime = get_le32( p + 12 );
    h.crc = get_le32( p + 16 );
    h.csize = get_le32( p + 20 );
    h.usize = get_le32( p + 24 );
    h.offset = get_le32( p + 42 );
    h.name.assign( (const char *)p + cdh_size, name_len );
    bool have_time = false;
    parse_extra( h, p + cdh_size + name_len, extra_len, have_time );
    if( !have_time ) h.mtime = parse_dos_datetime( datetime );
    h.mode = decode_mode( h, get_le16( p + 4 ), get_le32( p + 38 ) );
    if( h.name.empty() )
      { set_num_error( "Empty entry name at pos", cd_offset + pos );
        return false; }
    if( h.offset > cd_offset || cd_offset - h.offset < lh_size ||
        h.csize > cd_offset - h.offset - lh_size )
      { set_num_error( "Bad local header offset in entry", n );
        return false; }
    entry_vector.push_back( h );
    pos += cdh_size + name_len + extra_len + comment_len;
    }
  return true;
  }


Zip_index::Zip_index( const int infd )
  : insize( lseek( infd, 0, SEEK_END ) ), retval_( 0 )
  {
  if( insize < 0 )
    { set_errno_error( "Input file is not seekable: " ); return; }
  if( insize < eocd_size )
    { error_ = insize ? "Input file is truncated." : "Input file is empty.";
      retval_ = 2; return; }
  unsigned long long cd_offset = 0, cd_size = 0, num_entries = 0;
  if( !find_end( infd, cd_offset, cd_size, num_entries ) ) return;
  if( cd_offset > (unsigned long long)insize ||
      cd_size > (unsigned long long)insize - cd_offset )
    { error_ = "Central directory extends beyond the end of the file.";
      retval_ = 2; return; }
  if( cd_size > INT_MAX )
    { error_ = "Central directory is too large."; retval_ = 2; return; }
  if( cd_size == 0 )
    {
    if( num_entries != 0 )
      { error_ = "Central directory is empty."; retval_ = 2; }
    return;					// empty archive
    }
  Resizable_buffer rbuf( cd_size );
  if( rbuf.size() < cd_size ) { error_ = mem_msg; retval_ = 1; return; }
  if( preadblock( infd, rbuf.u8(), cd_size, cd_offset ) != (int)cd_size )
    { set_errno_error( "Error reading central directory: " ); return; }
  if( !parse_central_directory( rbuf.u8(), cd_size, num_entries, cd_offset ) )
    entry_vector.clear();
  }

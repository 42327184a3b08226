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
#include <zlib.h>

#include "parzip.h"
#include "zip_format.h"
#include "zip_writer.h"


namespace {

bool is_ascii( const std::string & name )
  {
  for( unsigned i = 0; i < name.size(); ++i )
    if( (unsigned char)name[i] >= 0x80 ) return false;
  return true;
  }


void put_timestamp( std::vector< uint8_t > & v, const long long mtime )
  {
  put_le16( v, xf_timestamp );
  put_le16( v, xt_size - 4 );
  v.push_back( 1 );				// mtime present
  put_le32( v, (uint32_t)clamp_time32( mtime ) );
  }


/* If zip64 is set, the sizes are 0xFFFFFFFF and a zip64 extra field with
   zeroed sizes tells readers that the data descriptor has 8-byte sizes. */
void put_local_header( std::vector< uint8_t > & v, const Zip_header & h,
                       const bool zip64 )
  {
  put_le32( v, lh_magic );
  put_le16( v, zip64 ? version_zip64 : version_default );
  put_le16( v, h.flags );
  put_le16( v, h.method );
  put_le32( v, dos_datetime( h.mtime ) );
  put_le32( v, 0 );		// crc and sizes are in the data descriptor
  put_le32( v, zip64 ? max32 : 0 );	// or are zero for directories
  put_le32( v, zip64 ? max32 : 0 );
  put_le16( v, h.name.size() );
  put_le16( v, xt_size + ( zip64 ? xz_local_size : 0 ) );
  v.insert( v.end(), h.name.begin(), h.name.end() );
  if( zip64 )
    {
    put_le16( v, xf_zip64 );
    put_le16( v, xz_local_size - 4 );
    put_le64( v, 0 );				// uncompressed size
    put_le64( v, 0 );				// compressed size
    }
  put_timestamp( v, h.mtime );
  }


void put_central_header( std::vector< uint8_t > & v, const Zip_header & h )
  {
  const int z64_len = 8 * ( h.usize >= max32 ) + 8 * ( h.csize >= max32 ) +
                      8 * ( h.offset >= max32 );
  put_le32( v, cdh_magic );
  put_le16( v, version_made );
  put_le16( v, z64_len ? version_zip64 : version_default );
  put_le16( v, h.flags );
  put_le16( v, h.method );
  put_le32( v, dos_datetime( h.mtime ) );
  put_le32( v, h.crc );
  put_le32( v, std::min( h.csize, (unsigned long long)max32 ) );
  put_le32( v, std::min( h.usize, (unsigned long long)max32 ) );
  put_le16( v, h.name.size() );
  put_le16( v, xt_size + ( z64_len ? 4 + z64_len : 0 ) );
  put_le16( v, 0 );				// comment length
  put_le16( v, 0 );				// disk number start
  put_le16( v, 0 );				// internal attributes
  put_le32( v, ( (uint32_t)h.mode << 16 ) | ( h.isdir() ? dos_dir_attr : 0 ) );
  put_le32( v, std::min( h.offset, (unsigned long long)max32 ) );
  v.insert( v.end(), h.name.begin(), h.name.end() );
  if( z64_len )
    {
    put_le16( v, xf_zip64 );
    put_le16( v, z64_len );
    if( h.usize >= max32 ) put_le64( v, h.usize );
    if( h.csize >= max32 ) put_le64( v, h.csize );
    if( h.offset >= max32 ) put_le64( v, h.offset );
    }
  put_timestamp( v, h.mtime );
  }

} // end namespace


// Compresses the data of one entry into the archive, computing its CRC.
class Deflate_sink : public Data_sink
  {
  enum { obuf_size = 65536 };
  Zip_writer & writer;
  z_stream zs;
  unsigned long long usize_, csize_;
  uint32_t crc_;
  bool initialized, error_;
  uint8_t obuf[obuf_size];

  Deflate_sink( const Deflate_sink & );		// declared as private
  void operator=( const Deflate_sink & );	// declared as private

  bool run( const int flush )
    {
    while( true )
      {
      zs.next_out = obuf; zs.avail_out = obuf_size;
      const int ret = deflate( &zs, flush );
      if( ret == Z_STREAM_ERROR ) { error_ = true; return false; }
      const unsigned have = obuf_size - zs.avail_out;
      if( have > 0 && !writer.write_data( obuf, have ) )
        { error_ = true; return false; }
      csize_ += have;
      if( flush == Z_FINISH ) { if( ret == Z_STREAM_END ) return true; }
      else if( zs.avail_out != 0 ) return true;	// all input consumed
      }
    }

public:
  Deflate_sink( Zip_writer & w, const int level )
    : writer( w ), usize_( 0 ), csize_( 0 ), crc_( crc32( 0L, Z_NULL, 0 ) ),
      initialized( false ), error_( false )
    {
    std::memset( &zs, 0, sizeof zs );
    initialized = deflateInit2( &zs, level, Z_DEFLATED, -MAX_WBITS, 8,
                                Z_DEFAULT_STRATEGY ) == Z_OK;
    }
  ~Deflate_sink() { if( initialized ) deflateEnd( &zs ); }

  bool ok() const { return initialized; }

  bool write( const uint8_t * const buf, const int size )
    {
    if( error_ ) return false;
    if( size <= 0 ) return true;
    crc_ = crc32( crc_, buf, size );
    usize_ += size;
    zs.next_in = (Bytef *)buf; zs.avail_in = size;
    return run( Z_NO_FLUSH );
    }

  bool finish()
    { if( error_ ) return false;
      zs.next_in = Z_NULL; zs.avail_in = 0; return run( Z_FINISH ); }

  uint32_t crc() const { return crc_; }
  unsigned long long usize() const { return usize_; }
  unsigned long long csize() const { return csize_; }
  };


bool Zip_writer::write_data( const uint8_t * const buf,
                             const unsigned long size )
  {
  if( write_error_ ) return false;
  if( writeblock( outfd, buf, size ) != (int)size )
    { write_error_ = true; write_errno = errno; return false; }
  pos += size;
  return true;
  }


int Zip_writer::write_fail( std::string & estr )
  {
  format_file_error( estr, archive_name.c_str(), wr_err_msg, write_errno );
  return 1;
  }


int Zip_writer::write_entry( const Zip_header & header,
                             const Content_source * const content,
                             std::string & estr )
  {
  if( finished ) internal_error( "entry written after end of archive." );
  if( write_error_ ) return write_fail( estr );
  if( header.name.empty() || header.name.size() > max16 )
    { format_file_error( estr, header.name.c_str(), "Invalid entry name." );
      return 1; }
  // the size of the file when it was prepared selects the descriptor format
  const bool zip64 = content && header.usize >= max32;
  Zip_header h( header );
  h.offset = pos;
  h.flags = is_ascii( h.name ) ? 0 : flag_utf8;
  h.crc = 0; h.csize = 0; h.usize = 0;
  if( content ) { h.flags |= flag_descriptor; h.method = method_deflate; }
  else h.method = method_store;			// directory, no data

  std::vector< uint8_t > buf;
  buf.reserve( lh_size + h.name.size() + xt_size + xz_local_size );
  put_local_header( buf, h, zip64 );
  if( !write_data( buf.data(), buf.size() ) ) return write_fail( estr );

  if( content )
    {
    Deflate_sink sink( *this, level );
    if( !sink.ok() )
      { format_file_error( estr, h.name.c_str(), mem_msg ); return 1; }
    if( content->write_to( sink, estr ) != 0 )
      { if( write_error_ ) return write_fail( estr ); return 1; }
    if( !sink.finish() )
      {
      if( write_error_ ) return write_fail( estr );
      format_file_error( estr, h.name.c_str(), "Deflate error." ); return 1;
      }
    h.crc = sink.crc(); h.usize = sink.usize(); h.csize = sink.csize();
    buf.clear();
    put_le32( buf, dd_magic );
    put_le32( buf, h.crc );
    if( zip64 || h.csize >= max32 || h.usize >= max32 )
      { put_le64( buf, h.csize ); put_le64( buf, h.usize ); }
    else { put_le32( buf, h.csize ); put_le32( buf, h.usize ); }
    if( !write_data( buf.data(), buf.size() ) ) return write_fail( estr );
    }
  header_vector.push_back( h );
  return 0;
  }


int Zip_writer::finish( std::string & estr )
  {
  if( finished ) internal_error( "archive finished twice." );
  if( write_error_ ) return write_fail( estr );
  const unsigned long long cd_offset = pos;
  std::vector< uint8_t > buf;
  for( unsigned long i = 0; i < header_vector.size(); ++i )
    {
    buf.clear();
    put_central_header( buf, header_vector[i] );
    if( !write_data( buf.data(), buf.size() ) ) return write_fail( estr );
    }
  const unsigned long long cd_size = pos - cd_offset;
  const unsigned long long num_entries = header_vector.size();
  buf.clear();
  if( num_entries >= max16 || cd_size >= max32 || cd_offset >= max32 )
    {
    const unsigned long long eocd64_offset = pos;
    put_le32( buf, eocd64_magic );
    put_le64( buf, eocd64_size - 12 );		// size of remaining record
    put_le16( buf, version_made );
    put_le16( buf, version_zip64 );
    put_le32( buf, 0 );				// number of this disk
    put_le32( buf, 0 );				// disk with central directory
    put_le64( buf, num_entries );		// entries on this disk
    put_le64( buf, num_entries );
    put_le64( buf, cd_size );
    put_le64( buf, cd_offset );
    put_le32( buf, locator_magic );
    put_le32( buf, 0 );
    put_le64( buf, eocd64_offset );
    put_le32( buf, 1 );				// total number of disks
    }
  put_le32( buf, eocd_magic );
  put_le16( buf, 0 );
  put_le16( buf, 0 );
  put_le16( buf, std::min( num_entries, (unsigned long long)max16 ) );
  put_le16( buf, std::min( num_entries, (unsigned long long)max16 ) );
  put_le32( buf, std::min( cd_size, (unsigned long long)max32 ) );
  put_le32( buf, std::min( cd_offset, (unsigned long long)max32 ) );
  put_le16( buf, 0 );				// comment length
  if( !write_data( buf.data(), buf.size() ) ) return write_fail( estr );
  finished = true;
  return 0;
  }

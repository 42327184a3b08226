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
#include <new>
#include <zlib.h>

#include "parzip.h"
#include "zip_format.h"
#include "zip_index.h"


namespace {

const char * const bad_lh_msg = "Bad local header.";
const char * const crc_msg = "CRC mismatch in entry data.";
const char * const size_msg = "Entry data size differs from recorded size.";
const char * const zdata_msg = "Corrupt compressed data.";

} // end namespace


Zip_entry_reader::Zip_entry_reader( const int fd )
  : infd( fd ), zs( new( std::nothrow ) z_stream_s ), ipos( 0 ), crest( 0 ),
    produced( 0 ), crc_( 0 ), e_msg_( "" ), e_code_( 0 ), open_( false ),
    data_end( false ), at_end( false )
  {
  if( !zs ) return;
  std::memset( zs, 0, sizeof *zs );
  if( inflateInit2( zs, -MAX_WBITS ) != Z_OK ) { delete zs; zs = 0; }
  }


Zip_entry_reader::~Zip_entry_reader()
  { if( zs ) { inflateEnd( zs ); delete zs; zs = 0; } }


int Zip_entry_reader::open( const Zip_header & h )
  {
  if( !zs ) return err( 1, mem_msg );
  header = h; open_ = false; data_end = false; at_end = false;
  produced = 0; crc_ = crc32( 0L, Z_NULL, 0 );
  if( h.flags & flag_encrypted )
    return err( 2, "Encrypted entries are not supported." );
  if( h.method != method_store && h.method != method_deflate )
    return err( 2, "Unsupported compression method." );
  uint8_t lh[lh_size];
  if( preadblock( infd, lh, lh_size, h.offset ) != lh_size )
    return errno ? err( 1, rd_err_msg, errno ) : err( 2, end_msg );
  if( get_le32( lh ) != lh_magic ) return err( 2, bad_lh_msg );
  ipos = h.offset + lh_size + get_le16( lh + 26 ) + get_le16( lh + 28 );
  crest = h.csize;
  if( h.method == method_deflate )
    {
    if( inflateReset( zs ) != Z_OK ) return err( 1, zdata_msg );
    zs->next_in = Z_NULL; zs->avail_in = 0;
    }
  else if( h.csize != h.usize ) return err( 2, size_msg );
  open_ = true;
  return 0;
  }


int Zip_entry_reader::check_end()
  {
  if( produced != header.usize ) return err( 2, size_msg );
  if( crc_ != header.crc ) return err( 2, crc_msg );
  at_end = true;
  return 0;
  }


int Zip_entry_reader::read( uint8_t * const buf, const int size, int & rd )
  {
  rd = 0;
  if( !open_ ) internal_error( "read from an entry not open." );
  if( at_end || size <= 0 ) return 0;
  if( header.method == method_store )
    {
    const int rsize = std::min( (unsigned long long)size, crest );
    if( rsize > 0 )
      {
      if( preadblock( infd, buf, rsize, ipos ) != rsize )
        return errno ? err( 1, rd_err_msg, errno ) : err( 2, end_msg );
      ipos += rsize; crest -= rsize; rd = rsize;
      }
    else data_end = true;
    }
  else if( !data_end )
    {
    zs->next_out = buf; zs->avail_out = size;
    while( zs->avail_out == (unsigned)size )	// until some data is produced
      {
      if( zs->avail_in == 0 && crest > 0 )
        {
        const int rsize = std::min( (unsigned long long)ibuf_size, crest );
        if( preadblock( infd, ibuf, rsize, ipos ) != rsize )
          return errno ? err( 1, rd_err_msg, errno ) : err( 2, end_msg );
        ipos += rsize; crest -= rsize;
        zs->next_in = ibuf; zs->avail_in = rsize;
        }
      const int ret = inflate( zs, Z_NO_FLUSH );
      if( ret == Z_STREAM_END ) { data_end = true; break; }
      if( ret == Z_MEM_ERROR ) return err( 1, mem_msg );
      if( ret == Z_DATA_ERROR || ret == Z_NEED_DICT || ret == Z_STREAM_ERROR )
        return err( 2, zdata_msg );
      if( ret == Z_BUF_ERROR && zs->avail_in == 0 && crest == 0 )
        return err( 2, end_msg );		// truncated deflate stream
      }
    rd = size - zs->avail_out;
    }
  if( rd > 0 )
    {
    crc_ = crc32( crc_, buf, rd );
    produced += rd;
    if( produced > header.usize ) return err( 2, size_msg );
    return 0;
    }
  return check_end();
  }

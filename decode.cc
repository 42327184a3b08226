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
#include <ctime>
#include <map>
#include <fcntl.h>
#include <unistd.h>
#include <utime.h>
#include <sys/stat.h>

#include "parzip.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_index.h"
#include "decode.h"

#ifndef O_BINARY
#define O_BINARY 0
#endif


bool Dest_fs::make_dir_path( const std::string & dirname )
  { return ::make_dir_path( dirname ); }


int Dest_fs::create_file( const std::string & filename, const mode_t mode )
  {
  // remove file before extraction to prevent following links
  std::remove( filename.c_str() );
  const int flags = O_CREAT | O_WRONLY | O_TRUNC | O_BINARY;
  const int outfd = open( filename.c_str(), flags, mode );
  if( outfd >= 0 ) fchmod( outfd, mode );	// ignore errors
  return outfd;
  }


int Dest_fs::close_file( const int fd ) { return close( fd ); }


bool Dest_fs::remove_file( const std::string & filename )
  { return unlink( filename.c_str() ) == 0; }


bool Dest_fs::set_mtime( const std::string & filename, const long long mtime )
  {
  struct utimbuf t;
  t.actime = mtime;
  t.modtime = mtime;
  return utime( filename.c_str(), &t ) == 0;
  }


/* Format in rbuf the name of the entry, or its mode, size, date and name
   if long_format. The result is newline terminated. */
bool format_entry_name( const Zip_header & header, Resizable_buffer & rbuf,
                        const bool long_format )
  {
  if( !long_format )
    {
    if( !rbuf.resize( header.name.size() + 2 ) ) return false;
    snprintf( rbuf(), rbuf.size(), "%s\n", header.name.c_str() );
    return true;
    }
  if( !rbuf.resize( mode_string_size + header.name.size() + 64 ) )
    return false;
  format_mode_string( header.mode, rbuf() );
  const time_t mtime = header.mtime;
  struct tm t;
  char buf[32];	// if local time and UTC fail, use seconds since epoch
  if( localtime_r( &mtime, &t ) || gmtime_r( &mtime, &t ) )
    snprintf( buf, sizeof buf, "%04d-%02u-%02u %02u:%02u", 1900 + t.tm_year,
              1 + t.tm_mon, t.tm_mday, t.tm_hour, t.tm_min );
  else snprintf( buf, sizeof buf, "%lld", header.mtime );
  snprintf( rbuf() + mode_string_size, rbuf.size() - mode_string_size,
            " %9llu %s %s\n", header.usize, buf, header.name.c_str() );
  return true;
  }


// Print the entries of the archive in central directory order.
int list_archive( const std::string & archive_name )
  {
  const char * const namep = archive_name.c_str();
  const int infd = open_instream( namep );
  if( infd < 0 ) return 1;
  const Zip_index index( infd );
  if( index.retval() != 0 )
    { show_file_error( namep, index.error().c_str() ); close( infd );
      return index.retval(); }
  Resizable_buffer rbuf;
  for( long i = 0; i < index.entries(); ++i )
    {
    if( !format_entry_name( index.entry( i ), rbuf, verbosity >= 1 ) )
      { show_error( mem_msg ); close( infd ); return 1; }
    std::fputs( rbuf(), stdout );
    }
  std::fflush( stdout );
  if( close( infd ) != 0 )
    { show_file_error( namep, eclosa_msg, errno ); return 1; }
  return 0;
  }


/* Create the directory entries in the calling thread, then restore the
   file entries in parallel. Errors don't stop the restore of the other
   entries. The first error found is returned. */
Op_error unpack_archive( const Unpack_options & opts )
  {
  Op_error error;
  std::string estr;
  const char * const namep = opts.archive.c_str();
  const int infd = open_instream( namep, &estr );
  if( infd < 0 ) { error.set( ek_restore, 1, estr ); return error; }
  const Zip_index index( infd );
  if( index.retval() != 0 )
    { format_file_error( estr, namep, index.error().c_str() ); close( infd );
      error.set( ek_restore, index.retval(), estr ); return error; }

  Dest_fs default_fs;
  Unpack_plan plan( opts, index, infd,
                    opts.dest_fs ? *opts.dest_fs : default_fs );
  plan.dest = clean_path( opts.dest );
  if( !plan.fs.make_dir_path( plan.dest ) )
    { format_file_error( estr, plan.dest.c_str(), mkdir_msg, errno );
      close( infd ); error.set( ek_restore, 1, estr ); return error; }
  get_umask();				// read the umask before starting threads

  First_error first_error;
  std::map< std::string, long > last_file;	// target -> position in file_ids
  for( long i = 0; i < index.entries(); ++i )
    {
    const Zip_header & header = index.entry( i );
    std::string target, msg;
    if( !header.isdir() )		// the last entry with a given name wins
      {
      if( gate_path( plan.dest, header.name, target, msg ) == 0 )
        {
        const std::pair< std::map< std::string, long >::iterator, bool > r =
          last_file.insert( std::make_pair( target,
                                            (long)plan.file_ids.size() ) );
        if( !r.second )
          {
          plan.file_ids[r.first->second] = -1;	// replaced by this one
          r.first->second = plan.file_ids.size();
          if( verbosity >= 3 )
            std::fprintf( stderr, "%s: Replaced by a later entry.\n",
                          header.name.c_str() );
          }
        }
      plan.file_ids.push_back( i ); continue;
      }
    if( gate_path( plan.dest, header.name, target, msg ) != 0 )
      {
      if( !first_error.set( ek_path_escape, 2, msg ) && verbosity >= 1 )
        std::fputs( msg.c_str(), stderr );
      continue;
      }
    if( !plan.fs.make_dir_path( target ) )
      {
      format_file_error( msg, header.name.c_str(), mkdir_msg, errno );
      if( !first_error.set( ek_restore, 1, msg ) && verbosity >= 1 )
        std::fputs( msg.c_str(), stderr );
      continue;
      }
    if( verbosity >= 1 )
      std::fprintf( stderr, "%s\n", header.name.c_str() );
    }

  plan.file_ids.erase( std::remove( plan.file_ids.begin(),
                     plan.file_ids.end(), -1L ), plan.file_ids.end() );
  if( plan.file_ids.size() )
    {
    long num_workers = opts.num_workers;
    if( num_workers <= 0 )
      num_workers = std::max( 1L, sysconf( _SC_NPROCESSORS_ONLN ) );
    num_workers = std::min( num_workers, (long)plan.file_ids.size() );
    const int num_permits = ( opts.num_permits > 0 ) ? opts.num_permits :
      std::max( 1L, sysconf( _SC_NPROCESSORS_ONLN ) );
    decode_mt( plan, first_error, num_workers, num_permits );
    }

  error = first_error.get();
  if( close( infd ) != 0 && error.ok() )
    { format_file_error( estr, namep, eclosa_msg, errno );
      error.set( ek_restore, 1, estr ); }
  return error;
  }
